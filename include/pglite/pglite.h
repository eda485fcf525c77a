// PGLite: PostgreSQL in WebAssembly, hosted on Fizzy
// Copyright 2024 The PGLite Authors.
// SPDX-License-Identifier: Apache-2.0

/// PGLite public C API.
/// @file
#pragma once

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/// Safe way of marking a function with `noexcept` C++ specifier.
#ifdef __cplusplus
#define PGLITE_NOEXCEPT noexcept
#else
#define PGLITE_NOEXCEPT
#endif

#ifdef __cplusplus
extern "C" {
#endif

/// Error codes.
typedef enum PGLiteErrorCode
{
    /// Success.
    PGLiteSuccess = 0,
    /// The filesystem image is not a valid gzip-compressed tar archive.
    PGLiteErrorArchive,
    /// Preparing the host directories failed.
    PGLiteErrorEnvironment,
    /// The WebAssembly module could not be parsed or instantiated.
    PGLiteErrorInstantiationFailed,
    /// The guest called proc_exit with a non-zero code.
    PGLiteErrorExit,
    /// The guest trapped.
    PGLiteErrorTrap,
    /// Memory allocation failed.
    PGLiteErrorMemoryAllocationFailed,
    /// Other error.
    PGLiteErrorOther
} PGLiteErrorCode;

/// Error information.
typedef struct PGLiteError
{
    /// Error code.
    PGLiteErrorCode code;
    /// Guest exit code. Valid only if #code equals ::PGLiteErrorExit.
    uint32_t exit_code;
    /// NULL-terminated error message.
    char message[256];
} PGLiteError;

/// The opaque data type representing a database session.
typedef struct PGLite PGLite;

/// Output callback.
///
/// @param  context    Opaque pointer passed in PGLiteOptions::write_context.
/// @param  data       Output bytes. Not NULL-terminated.
/// @param  size       Number of bytes.
typedef void (*PGLiteWriteFn)(void* context, const char* data, size_t size);

/// Session options.
typedef struct PGLiteOptions
{
    /// Host directory receiving the extracted filesystem. NULL means the current directory.
    const char* root_dir;
    /// Gzip-compressed tar image. NULL means the image embedded at build time.
    const uint8_t* bundle;
    /// Size of #bundle.
    size_t bundle_size;
    /// Receives guest standard output. NULL means the process standard output.
    PGLiteWriteFn write_stdout;
    /// Receives guest standard error, including query results. NULL means the process standard
    /// error.
    PGLiteWriteFn write_stderr;
    /// Opaque pointer passed to #write_stdout and #write_stderr.
    void* write_context;
    /// Hard limit for guest memory growth in pages. Cannot be above 65536.
    uint32_t memory_pages_limit;
} PGLiteOptions;

/// Fill options with default values.
///
/// @param  options    Pointer to options. Cannot be NULL.
void pglite_init_options(PGLiteOptions* options) PGLITE_NOEXCEPT;

/// Check whether a filesystem image was embedded at build time.
bool pglite_has_embedded_bundle(void) PGLITE_NOEXCEPT;

/// Create a session: prepare the filesystem, instantiate PostgreSQL and initialize the cluster.
///
/// @param  options    Pointer to options. Can be NULL, then defaults are used.
/// @param  error      Pointer to store detailed error information at. Can be NULL if error
///                    information is not required.
/// @return            non-NULL pointer to session in case of success, NULL otherwise.
PGLite* pglite_create(const PGLiteOptions* options, PGLiteError* error) PGLITE_NOEXCEPT;

/// Execute a single SQL statement.
///
/// @param  pglite    Pointer to session. Cannot be NULL.
/// @param  sql       NULL-terminated SQL text. Cannot be NULL.
/// @param  error     Pointer to store detailed error information at. Can be NULL.
/// @return           true in case of success, false otherwise.
bool pglite_query(PGLite* pglite, const char* sql, PGLiteError* error) PGLITE_NOEXCEPT;

/// Execute statements separated by blank lines.
///
/// @param  pglite    Pointer to session. Cannot be NULL.
/// @param  input     NULL-terminated SQL script. Cannot be NULL.
/// @param  error     Pointer to store detailed error information at. Can be NULL.
/// @return           true if all statements were executed, false at the first failure.
bool pglite_run_queries(PGLite* pglite, const char* input, PGLiteError* error) PGLITE_NOEXCEPT;

/// Free resources associated with the session.
///
/// @param  pglite    Pointer to session. If NULL is passed, function has no effect.
void pglite_free(PGLite* pglite) PGLITE_NOEXCEPT;

#ifdef __cplusplus
}
#endif
