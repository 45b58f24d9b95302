/* Copyright (c) 2026 The pdfredact Authors
 *
 * This file is part of pdfredact.
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

#ifndef PDFREDACT_DLL_HH
#define PDFREDACT_DLL_HH

#define PDFREDACT_MAJOR_VERSION 1
#define PDFREDACT_MINOR_VERSION 0
#define PDFREDACT_PATCH_VERSION 0
#define PDFREDACT_VERSION "1.0.0"

/*
 * These symbols control which functions, classes, and methods are
 * exposed to the public ABI when libpdfredact is built as a shared
 * library. They follow the same rules as QPDF_DLL, QPDF_DLL_CLASS,
 * and QPDF_DLL_PRIVATE in qpdf/DLL.h: export classes that are thrown
 * or inherited from with PDFREDACT_DLL_CLASS, export methods with
 * PDFREDACT_DLL, and hide private methods of exported classes with
 * PDFREDACT_DLL_PRIVATE.
 */

#if defined _WIN32 || defined __CYGWIN__
# ifdef libpdfredact_EXPORTS
#  define PDFREDACT_DLL __declspec(dllexport)
# else
#  define PDFREDACT_DLL
# endif
# define PDFREDACT_DLL_PRIVATE
#elif defined __GNUC__
# define PDFREDACT_DLL __attribute__((visibility("default")))
# define PDFREDACT_DLL_PRIVATE __attribute__((visibility("hidden")))
#else
# define PDFREDACT_DLL
# define PDFREDACT_DLL_PRIVATE
#endif
#ifdef __GNUC__
# define PDFREDACT_DLL_CLASS PDFREDACT_DLL
#else
# define PDFREDACT_DLL_CLASS
#endif

#endif /* PDFREDACT_DLL_HH */
