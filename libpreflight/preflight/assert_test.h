/*
 * Include this file to use assert in test code. This will allow
 * the use of assert and ensure that NDEBUG is undefined (which
 * would cause spurious passes).
 */

#ifndef PREFLIGHT_ASSERT_TEST_H
#define PREFLIGHT_ASSERT_TEST_H

#ifdef NDEBUG
# undef NDEBUG
#endif
#include <cassert>

#endif /* PREFLIGHT_ASSERT_TEST_H */
