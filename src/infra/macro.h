#if !defined(_FANMV_INFRA_MACRO_H_INCLUDED_)
#define _FANMV_INFRA_MACRO_H_INCLUDED_

#if !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)


//
// Macros for disabled copy/move constructor
//
#define FANMV_DISABLE_COPY_CONSTRUCTOR(_Class_) \
    _Class_(const _Class_&) = delete; \
    _Class_& operator =(const _Class_&) = delete;

#define FANMV_DISABLE_MOVE_CONSTRUCTOR(_Class_) \
    _Class_(_Class_&&) = delete; \
    _Class_& operator =(_Class_&&) = delete;


//
// Helper macros
//
#define JUST(...)       __VA_ARGS__


#endif  // !defined(_FANMV_INFRA_MACRO_H_INCLUDED_)
