// Handler.hpp
// Type-erased catcher callable and compile-time inference of the exception type it targets
#pragma once

#include <Neha/Catchers/Export.hpp>
#include <Neha/Catchers/Exception.hpp>
#include <Neha/Catchers/Types.hpp>

#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace Neha::Catchers
{

  namespace detail
  {
    template <class Sig>
    struct SignatureTraits;

    template <class R, class... A>
    struct SignatureTraits<R(A...)>
    {
      using Ret = R;
      using Args = std::tuple<A...>;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
    };

    template <class R, class... A>
    struct SignatureTraits<R(A...) noexcept> : SignatureTraits<R(A...)>
    {
    };

    template <class R, class... A>
    struct SignatureTraits<R (*)(A...)> : SignatureTraits<R(A...)>
    {
    };

    template <class R, class... A>
    struct SignatureTraits<R (*)(A...) noexcept> : SignatureTraits<R(A...)>
    {
    };

    template <class C, class R, class... A>
    struct SignatureTraits<R (C::*)(A...)> : SignatureTraits<R(A...)>
    {
    };

    template <class C, class R, class... A>
    struct SignatureTraits<R (C::*)(A...) const> : SignatureTraits<R(A...)>
    {
    };

    template <class C, class R, class... A>
    struct SignatureTraits<R (C::*)(A...) noexcept> : SignatureTraits<R(A...)>
    {
    };

    template <class C, class R, class... A>
    struct SignatureTraits<R (C::*)(A...) const noexcept> : SignatureTraits<R(A...)>
    {
    };

    // Callables whose parameter list can be read: functions, function pointers and
    // class types with a single non-template call operator. Generic lambdas are not.
    template <class F>
    concept HasFixedSignature = std::is_function_v<std::remove_pointer_t<F>> || requires { &F::operator(); };

    template <class F>
    struct CallableSignature : SignatureTraits<F>
    {
    };

    template <class F>
      requires requires { &F::operator(); }
    struct CallableSignature<F> : SignatureTraits<decltype(&F::operator())>
    {
    };

    template <class F>
    using FirstParamT = std::remove_cvref_t<std::tuple_element_t<0, typename CallableSignature<F>::Args>>;

    template <class Call>
    ExpectedAny InvokeBoxed(Call &&call)
    {
      using R = std::invoke_result_t<Call>;
      if constexpr (std::is_void_v<R>)
      {
        std::forward<Call>(call)();
        return Any::MakeVoid();
      }
      else if constexpr (std::is_same_v<std::remove_cvref_t<R>, ExpectedAny>)
      {
        return std::forward<Call>(call)();
      }
      else if constexpr (std::is_same_v<std::remove_cvref_t<R>, Any>)
      {
        return ExpectedAny{std::forward<Call>(call)()};
      }
      else
      {
        return Any{std::forward<Call>(call)()};
      }
    }
  } // namespace detail

  /**
   * Exception type a callable targets, read from its declared parameter.
   * A concrete Exception subclass parameter yields that subclass' identifier.
   * `const Exception &`, a generic (`auto`) parameter or no parameter at all
   * yield RootExceptionName.
   */
  template <class F>
  constexpr std::string_view InferTargetType() noexcept
  {
    using D = std::decay_t<F>;
    if constexpr (detail::HasFixedSignature<D>)
    {
      constexpr auto arity = detail::CallableSignature<D>::Arity;
      static_assert(arity <= 1, "catchers take at most one parameter");
      if constexpr (arity == 0)
      {
        return RootExceptionName;
      }
      else
      {
        using P = detail::FirstParamT<D>;
        static_assert(std::is_base_of_v<Exception, P>, "catcher parameter must be an Exception type");
        return ExceptionTypeNameOf<P>();
      }
    }
    else
    {
      return RootExceptionName;
    }
  }

  class NEHA_CATCHERS_API Handler
  {
  public:
    using Invoker = std::function<ExpectedAny(const Exception &)>;

    Handler() = default;
    explicit Handler(Invoker invoker, std::string_view declaredTarget = {})
        : m_invoker(std::move(invoker)), m_declaredTarget(declaredTarget)
    {
    }

    // Wraps any catcher callable (arity 0 or 1, any result) and records the
    // exception type inferred from its parameter. Null function pointers and
    // empty std::function objects produce a non-callable Handler.
    template <class F>
      requires(!std::is_same_v<std::remove_cvref_t<F>, Handler>)
    [[nodiscard]] static Handler From(F &&fn)
    {
      using D = std::decay_t<F>;
      if constexpr (requires(const D &d) { static_cast<bool>(d); })
      {
        if (!static_cast<bool>(fn))
          return Handler{};
      }
      const auto declared = InferTargetType<D>();
      return Handler{MakeInvoker(D(std::forward<F>(fn))),
                     declared == RootExceptionName ? std::string_view{} : declared};
    }

    [[nodiscard]] bool IsCallable() const noexcept { return static_cast<bool>(m_invoker); }

    // Empty when the callable declared no specific exception type.
    [[nodiscard]] std::string_view DeclaredTarget() const noexcept { return m_declaredTarget; }

    ExpectedAny operator()(const Exception &exception) const;

  private:
    template <class D>
    static Invoker MakeInvoker(D fn)
    {
      return [fn = std::move(fn)](const Exception &exception) mutable -> ExpectedAny
      {
        if constexpr (detail::HasFixedSignature<D>)
        {
          if constexpr (detail::CallableSignature<D>::Arity == 0)
          {
            return detail::InvokeBoxed([&]() -> decltype(auto) { return std::invoke(fn); });
          }
          else
          {
            using P = detail::FirstParamT<D>;
            if constexpr (std::is_same_v<P, Exception>)
            {
              return detail::InvokeBoxed([&]() -> decltype(auto) { return std::invoke(fn, exception); });
            }
            else
            {
              const auto *typed = dynamic_cast<const P *>(&exception);
              if (!typed)
                return std::unexpected(Error{ErrorCode::InvalidArgument, "exception object is not of the catcher parameter type"});
              return detail::InvokeBoxed([&]() -> decltype(auto) { return std::invoke(fn, *typed); });
            }
          }
        }
        else if constexpr (std::is_invocable_v<D &, const Exception &>)
        {
          return detail::InvokeBoxed([&]() -> decltype(auto) { return std::invoke(fn, exception); });
        }
        else
        {
          static_assert(std::is_invocable_v<D &>, "catcher must be callable with an Exception or with no arguments");
          return detail::InvokeBoxed([&]() -> decltype(auto) { return std::invoke(fn); });
        }
      };
    }

    Invoker m_invoker{};
    std::string m_declaredTarget{};
  };

  // Target a handler was declared for, or RootExceptionName when it declared none.
  [[nodiscard]] NEHA_CATCHERS_API std::string_view InferTargetType(const Handler &handler) noexcept;

} // namespace Neha::Catchers
