#if !defined(_FANMV_INFRA_SWEEPER_H_INCLUDED_)
#define _FANMV_INFRA_SWEEPER_H_INCLUDED_

#if !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)


namespace infra
{
    //
    // Runs a cleanup function when leaving the scope.
    // Sweepers declared in the same scope run in reverse declaration order.
    //
    class sweeper
    {
    public:
        FANMV_DISABLE_COPY_CONSTRUCTOR(sweeper)
        FANMV_DISABLE_MOVE_CONSTRUCTOR(sweeper)

        template<typename TFunc>
        sweeper(TFunc fn)  // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)
            : _sweep_fn(std::move(fn))
        { }

        ~sweeper()
        {
            if (_sweep_fn) {
                _sweep_fn();
            }
        }

    private:
        const std::function<void() /*noexcept*/> _sweep_fn;
    };

}  // namespace infra


#endif  // !defined(_FANMV_INFRA_SWEEPER_H_INCLUDED_)
