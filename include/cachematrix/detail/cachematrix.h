#ifndef CACHEMATRIX_H_
#define CACHEMATRIX_H_

#ifdef CACHEMATRIX_EXPORTS
#    ifdef _MSC_VER
#        define CMAT_API __declspec(dllexport)
#    else
#        define CMAT_API __attribute__((visibility("default")))
#    endif
#else
#    ifdef _MSC_VER
#        define CMAT_API __declspec(dllimport)
#    else
#        define CMAT_API
#    endif
#endif

#ifdef __cplusplus
extern "C" {
#endif

typedef struct cmat_CacheMatrix_* cmat_CacheMatrix;

// Row-major, values[row * cols + col]
typedef struct cmat_MatrixView {
    int rows;
    int cols;
    double const* values;
} cmat_MatrixView;

typedef void (*cmat_CacheHitCallback)(void* /*user_data*/);

typedef struct cmat_Options {
    double tolerance;
    cmat_CacheHitCallback on_cache_hit;
    void* user_data;
} cmat_Options;

typedef enum cmat_Result { cmat_success, cmat_error, cmat_not_invertible } cmat_Result;

struct cmat_Api {
    cmat_Result (*create_cache_matrix)(cmat_CacheMatrix*, cmat_MatrixView const*);
    void (*destroy_cache_matrix)(cmat_CacheMatrix);

    cmat_Result (*set_matrix)(cmat_CacheMatrix, cmat_MatrixView const*);
    void (*get_matrix)(cmat_CacheMatrix, cmat_MatrixView* /*out_matrix*/);
    cmat_Result (*set_inverse)(cmat_CacheMatrix, cmat_MatrixView const*);
    int (*get_inverse)(cmat_CacheMatrix, cmat_MatrixView* /*out_inverse*/);

    cmat_Result (*solve)(cmat_CacheMatrix, cmat_Options const*, cmat_MatrixView* /*out_inverse*/);
    // Fails unless the solution has exactly out_size values (matrix rows * rhs cols)
    cmat_Result (*solve_system)(cmat_CacheMatrix, cmat_MatrixView const* /*rhs*/,
                                cmat_Options const*, double* /*out_values*/, int /*out_size*/);

    char const* (*last_error)();
};

CMAT_API struct cmat_Api const* cmat_init();

#ifdef __cplusplus
} // extern "C"
#endif

#endif // CACHEMATRIX_H_
