#if !defined(_FANMV_INFRA_ASSERTION_H_INCLUDED_)
#define _FANMV_INFRA_ASSERTION_H_INCLUDED_

#if !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)


#define ASSERT(_What_, ...) \
    do { \
        if (!(_What_)) { \
            JUST(LOG_ERROR("ASSERT(" #_What_ ") failed. " __VA_ARGS__)); \
            std::abort(); \
        } \
    } while(false)


#define PANIC_TERMINATE(...) \
    do { \
        JUST(LOG_ERROR("PANIC! " __VA_ARGS__)); \
        std::abort(); \
    } while(false)


#define THROW_SYSTEM_ERROR(_Errno_, _Func_) \
    throw std::system_error(std::error_code((_Errno_), std::system_category()), #_Func_ "() failed")


#endif  // !defined(_FANMV_INFRA_ASSERTION_H_INCLUDED_)
