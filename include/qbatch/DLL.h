/* Copyright (c) 2026 The qbatch Authors
 *
 * This file is part of qbatch.
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

#ifndef QBATCH_DLL_HH
#define QBATCH_DLL_HH

#define QBATCH_MAJOR_VERSION 1
#define QBATCH_MINOR_VERSION 0
#define QBATCH_PATCH_VERSION 0
#define QBATCH_VERSION "1.0.0"

/*
 * These macros control which functions, classes, and methods are
 * exposed to the public ABI. They follow the same rules as qpdf's
 * QPDF_DLL, QPDF_DLL_PRIVATE, and QPDF_DLL_CLASS:
 *
 * * QBATCH_DLL_CLASS exports a class's run-time type information and
 *   vtable. This is needed for classes that are thrown as exceptions,
 *   inherited from, or used with dynamic_cast across the shared
 *   library boundary.
 *
 * * QBATCH_DLL exports an individual function or method.
 *
 * * QBATCH_DLL_PRIVATE unexports a private method of an exported class.
 *
 * The library is built with visibility=hidden, so anything not marked
 * is not part of the public ABI. libqbatch_EXPORTS is defined by CMake
 * while building the shared library and is only used for Windows
 * builds.
 */

#if defined _WIN32 || defined __CYGWIN__
# ifdef libqbatch_EXPORTS
#  define QBATCH_DLL __declspec(dllexport)
# else
#  define QBATCH_DLL
# endif
# define QBATCH_DLL_PRIVATE
#elif defined __GNUC__
# define QBATCH_DLL __attribute__((visibility("default")))
# define QBATCH_DLL_PRIVATE __attribute__((visibility("hidden")))
#else
# define QBATCH_DLL
# define QBATCH_DLL_PRIVATE
#endif
#ifdef __GNUC__
# define QBATCH_DLL_CLASS QBATCH_DLL
#else
# define QBATCH_DLL_CLASS
#endif

#endif /* QBATCH_DLL_HH */
