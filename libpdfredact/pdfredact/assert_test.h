/*
 * Include this file to use assert in test programs. It ensures that
 * NDEBUG is undefined so that a release build still runs every check.
 */

#ifndef PDFREDACT_ASSERT_TEST_H
#define PDFREDACT_ASSERT_TEST_H

#ifdef NDEBUG
# undef NDEBUG
#endif
#include <assert.h>

#endif /* PDFREDACT_ASSERT_TEST_H */
