#ifndef BASTION_ERROR_H_INCLUDED
#define BASTION_ERROR_H_INCLUDED

#if defined(_WIN32) && defined(BASTION_BUILDING_LIBRARY)
#    define BASTION_API __declspec(dllexport)
#elif defined(_WIN32)
#    define BASTION_API __declspec(dllimport)
#else
#    define BASTION_API __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Defines all possible error codes.
 */
typedef enum bastion_errc_t {
    BASTION_OK = 0,
    BASTION_ERROR_BAD_ARG = 1,          /* Invalid argument */
    BASTION_ERROR_BAD_MODULE = 2,       /* Module failed structural verification */
    BASTION_ERROR_MODULE_TOO_LARGE = 3, /* A module table exceeds the configured size limit */
    BASTION_ERROR_OUT_OF_BOUNDS = 4,    /* A table index does not resolve */
    BASTION_ERROR_INTERNAL = 1000,      /* Internal error */
} bastion_errc_t;

/**
 * Returns the name of the given error code.
 * The string points into static storage and must not be freed.
 */
BASTION_API const char* bastion_errc_name(bastion_errc_t e);

/**
 * Returns a human readable description of the given error code.
 * The string points into static storage and must not be freed.
 */
BASTION_API const char* bastion_errc_message(bastion_errc_t e);

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif // BASTION_ERROR_H_INCLUDED
