#ifndef DIFFTREE_CORE_UTILITIES_HPP
#define DIFFTREE_CORE_UTILITIES_HPP

#include <difftree/core/exception.hpp>

#include <memory>
#include <tuple>
#include <type_traits>
#include <utility>

namespace difftree {

// invalid_enum_value is thrown when an enum's raw (integer) value is invalid.
DIFFTREE_DEFINE_EXCEPTION(invalid_enum_value)
DIFFTREE_DEFINE_ERROR_INFO(string, enum_id)
DIFFTREE_DEFINE_ERROR_INFO(int, enum_value)

// If a simple parsing operation fails, this exception can be thrown.
DIFFTREE_DEFINE_EXCEPTION(parsing_error)
DIFFTREE_DEFINE_ERROR_INFO(string, expected_format)
DIFFTREE_DEFINE_ERROR_INFO(string, parsed_text)
DIFFTREE_DEFINE_ERROR_INFO(string, parsing_error)

// If an error occurs internally within library that provides its own
// error messages, this is used to convey that message.
DIFFTREE_DEFINE_ERROR_INFO(string, internal_error_message)

// This can be used to flag errors that represent failed checks on conditions
// that should be guaranteed internally.
DIFFTREE_DEFINE_EXCEPTION(internal_check_failed)

// function_view is the non-owning equivalent of std::function.
template<class Signature>
class function_view;
template<class Return, class... Args>
class function_view<Return(Args...)>
{
 private:
    void* _ptr;
    Return (*_erased_fn)(void*, Args...);

 public:
    template<typename T>
    function_view(T&& x) noexcept : _ptr{(void*) std::addressof(x)}
    {
        _erased_fn = [](void* ptr, Args... xs) -> Return {
            return (*reinterpret_cast<std::add_pointer_t<T>>(ptr))(
                std::forward<Args>(xs)...);
        };
    }

    decltype(auto)
    operator()(Args... xs) const
        noexcept(noexcept(_erased_fn(_ptr, std::forward<Args>(xs)...)))
    {
        return _erased_fn(_ptr, std::forward<Args>(xs)...);
    }
};

// Invoke :fn on each element of the tuple :t, passing the element along with
// its index as a std::integral_constant.
template<class Tuple, class Fn, size_t... Indices>
void
for_each_indexed_impl(Tuple&& t, Fn&& fn, std::index_sequence<Indices...>)
{
    (fn(std::integral_constant<size_t, Indices>(), std::get<Indices>(t)), ...);
}
template<class Tuple, class Fn>
void
for_each_indexed(Tuple&& t, Fn&& fn)
{
    for_each_indexed_impl(
        std::forward<Tuple>(t),
        std::forward<Fn>(fn),
        std::make_index_sequence<
            std::tuple_size<std::remove_reference_t<Tuple>>::value>());
}

} // namespace difftree

#endif
