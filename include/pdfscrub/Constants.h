/* Copyright (c) 2024 the pdfscrub authors
 *
 * This file is part of pdfscrub.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef PDFSCRUB_CONSTANTS_H
#define PDFSCRUB_CONSTANTS_H

/*
 * REMEMBER:
 *
 * Keep this file 'C' compatible so it can be used from C code that
 * drives the command-line tool and inspects its exit status.
 */

/* Exit Codes from the pdfscrub CLI */

enum pdfscrub_exit_code_e {
    pdfscrub_exit_success = 0,
    /* Normal exit codes */
    pdfscrub_exit_error = 1,
    pdfscrub_exit_cannot_check = 2,
    pdfscrub_exit_warning = 3,
};

/* Error Codes */

enum pdfscrub_error_code_e {
    pdfscrub_e_success = 0,
    pdfscrub_e_input_not_found, /* input file is missing or unreadable */
    pdfscrub_e_password,        /* encrypted file requires a password */
    pdfscrub_e_structure,       /* damaged file or malformed object graph */
    pdfscrub_e_output,          /* output file could not be written */
    pdfscrub_e_invocation,      /* invalid arguments to an operation */
};

#endif /* PDFSCRUB_CONSTANTS_H */
