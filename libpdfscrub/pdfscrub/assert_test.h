/*
 * Include this file to use assert in tests. This will allow the use
 * of assert and ensure that NDEBUG is undefined (which would cause
 * spurious passes in release builds).
 */

#ifndef PDFSCRUB_ASSERT_TEST_H
#define PDFSCRUB_ASSERT_TEST_H

#ifdef NDEBUG
# undef NDEBUG
#endif
#include <assert.h>

#endif /* PDFSCRUB_ASSERT_TEST_H */
