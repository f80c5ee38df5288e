/**
 * @file
 * @brief Tabular printer of resource objects
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <functional>
#include <ostream>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include <api/types.hpp>
#include <common/common.hpp>

#include <printer/printer.hpp>

namespace resprint {
namespace printer {

namespace detail {

struct NotCallable {
    static constexpr bool callable = false;
};

template <typename R, typename ...Args>
struct Callable {
    static constexpr bool callable = true;
    static constexpr size_t arity = sizeof...(Args);
    using Result = R;
    using Params = std::tuple<Args...>;
};

/** @brief Signature of a free function or a function pointer */
template <typename F>
struct Signature : NotCallable {};

template <typename R, typename ...Args>
struct Signature<R(Args...)> : Callable<R, Args...> {};

template <typename R, typename ...Args>
struct Signature<R(Args...) noexcept> : Callable<R, Args...> {};

template <typename R, typename ...Args>
struct Signature<R(*)(Args...)> : Callable<R, Args...> {};

template <typename R, typename ...Args>
struct Signature<R(*)(Args...) noexcept> : Callable<R, Args...> {};

/** @brief Signature of a call operator, the object parameter is not counted */
template <typename M>
struct MemberSignature : NotCallable {};

template <typename C, typename R, typename ...Args>
struct MemberSignature<R(C::*)(Args...)> : Callable<R, Args...> {};

template <typename C, typename R, typename ...Args>
struct MemberSignature<R(C::*)(Args...) const> : Callable<R, Args...> {};

template <typename C, typename R, typename ...Args>
struct MemberSignature<R(C::*)(Args...) noexcept> : Callable<R, Args...> {};

template <typename C, typename R, typename ...Args>
struct MemberSignature<R(C::*)(Args...) const noexcept> : Callable<R, Args...> {};

// Function objects with a single non-template call operator
template <typename F, typename = void>
struct CallOperator : NotCallable {};

template <typename F>
struct CallOperator<F, std::void_t<decltype(&F::operator())>>
    : MemberSignature<decltype(&F::operator())> {};

template <typename F>
struct HandlerShape
    : std::conditional_t<std::is_class<F>::value, CallOperator<F>, Signature<F>> {};

/** @brief Type whose header is printed for T, lists share the header of their items */
template <typename T, typename = void>
struct HeaderType {
    using type = T;
};

template <typename T>
struct HeaderType<T, std::void_t<typename T::Item>> {
    using type = typename T::Item;
};

/**
 * @brief Make a print function of a list that prints every item by @p print_item.
 *
 * Printing stops at the first item that fails and the error propagates.
 */
template <typename List, typename ItemFn>
std::function<void(const List &, std::ostream &)>
print_each(ItemFn print_item)
{
    return [print_item](const List &list, std::ostream &output) mutable {
        for (const typename List::Item &item : list.items) {
            print_item(item, output);
        }
    };
}

} // detail

/**
 * @brief Printer of objects as aligned text tables.
 *
 * Every printable type has a handler that consists of the column names and
 * a print function writing one tab-separated row per object. The column
 * names are printed as a header whenever the type of the printed object
 * differs from the type of the previously printed object, unless headers are
 * disabled. A list and its items count as the same type.
 *
 * The printer keeps the last printed type, so one instance must not be used
 * concurrently.
 */
class HumanReadablePrinter : public Printer {
public:
    /**
     * @brief Create the printer with handlers of all known resource types.
     * @param no_headers Never print the header row
     */
    HumanReadablePrinter(bool no_headers = false);

    virtual
    ~HumanReadablePrinter() = default;

    /**
     * @brief Register a print function.
     *
     * The function must have the form `void fn(const T &obj, std::ostream &out)`
     * where T is a concrete resource type. It replaces the handler previously
     * registered for T.
     *
     * @param columns Column names of the header
     * @param fn      Print function
     * @throw MalformedHandler if the function does not have the required form,
     *   the registered handlers are not changed
     */
    template <typename Fn>
    void
    handler(const std::vector<std::string> &columns, Fn fn);

    /** @brief Whether a handler is registered for the type */
    bool
    has_handler(std::type_index type) const;

    /**
     * @brief Print the object using the handler of its type.
     * @throw UnknownTypeError if no handler is registered for the object type
     * @throw WriteError if the output stream fails
     */
    virtual void
    print_obj(const api::Object &obj, std::ostream &output) override;

    virtual bool
    is_versioned() const override { return false; }

private:
    using PrintFn = std::function<void(const api::Object &, std::ostream &)>;

    struct Handler {
        std::type_index header_type;
        std::vector<std::string> columns;
        PrintFn print_fn;
    };

    std::unordered_map<std::type_index, Handler> m_handlers;
    bool m_no_headers;
    Optional<std::type_index> m_last_type;

    void
    add_handler(
        std::type_index type,
        std::type_index header_type,
        const std::vector<std::string> &columns,
        PrintFn print_fn);

    void
    add_default_handlers();

    [[noreturn]] static void
    reject_handler(const std::string &reason);
};

template <typename Fn>
void
HumanReadablePrinter::handler(const std::vector<std::string> &columns, Fn fn)
{
    using Shape = detail::HandlerShape<std::decay_t<Fn>>;

    if constexpr (!Shape::callable) {
        reject_handler("print function is not a function");
    } else if constexpr (Shape::arity != 2) {
        reject_handler("print function must take 2 parameters, it takes "
            + std::to_string(Shape::arity));
    } else if constexpr (!std::is_void<typename Shape::Result>::value) {
        reject_handler("print function must not return a value");
    } else {
        using ObjParam = std::tuple_element_t<0, typename Shape::Params>;
        using OutParam = std::tuple_element_t<1, typename Shape::Params>;
        using T = std::remove_cv_t<std::remove_reference_t<ObjParam>>;

        if constexpr (!std::is_same<OutParam, std::ostream &>::value) {
            reject_handler("second parameter of print function must be std::ostream &");
        } else if constexpr (!std::is_base_of<api::Object, T>::value
                || std::is_same<T, api::Object>::value
                || !std::is_same<ObjParam, const T &>::value) {
            reject_handler("first parameter of print function must be a const reference to a resource type");
        } else {
            using H = typename detail::HeaderType<T>::type;

            add_handler(typeid(T), typeid(H), columns, [fn](const api::Object &obj, std::ostream &output) mutable {
                fn(static_cast<const T &>(obj), output);
            });
        }
    }
}

} // printer
} // resprint
