#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

namespace NEventEmitter {

    class TEventEmitter;

    /// Значение, которое передаётся слушателям и возвращается ими.
    using TValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

    /// Аргументы одного вызова EmitEvent.
    using TArgs = std::vector<TValue>;

    /// Типы, которые MakeValue умеет приводить к TValue.
    template <typename T>
    concept ValueConvertible =
        std::is_same_v<std::remove_cvref_t<T>, TValue> ||
        std::is_same_v<std::remove_cvref_t<T>, std::monostate> ||
        std::is_arithmetic_v<std::remove_cvref_t<T>> ||
        std::is_convertible_v<const std::remove_cvref_t<T>&, std::string_view>;

    /// Приведение скаляров и строк к TValue.
    /// bool остаётся bool, целые становятся int64, вещественные - double.
    /// Нулевой указатель на строку даёт monostate.
    template <typename T>
        requires ValueConvertible<T>
    TValue MakeValue(T&& Value) {
        using TDecayed = std::remove_cvref_t<T>;

        if constexpr (std::is_same_v<TDecayed, TValue>) {
            return std::forward<T>(Value);
        } else if constexpr (std::is_same_v<TDecayed, std::monostate>) {
            return TValue{};
        } else if constexpr (std::is_same_v<TDecayed, bool>) {
            return TValue{std::in_place_type<bool>, Value};
        } else if constexpr (std::is_integral_v<TDecayed>) {
            return TValue{std::in_place_type<std::int64_t>, static_cast<std::int64_t>(Value)};
        } else if constexpr (std::is_floating_point_v<TDecayed>) {
            return TValue{std::in_place_type<double>, static_cast<double>(Value)};
        } else {
            if constexpr (std::is_pointer_v<TDecayed>) {
                if (Value == nullptr) {
                    return TValue{};
                }
            }
            return TValue{std::in_place_type<std::string>, std::string(std::string_view(Value))};
        }
    }

    namespace NInternal {

        template <typename T>
        struct TIsStdFunction: std::false_type {};

        template <typename TSignature>
        struct TIsStdFunction<std::function<TSignature>>: std::true_type {};

        /// Вызывает Call и приводит результат к TValue (void -> monostate).
        template <typename TCall>
        TValue InvokeToValue(TCall&& Call) {
            using TResult = std::invoke_result_t<TCall&>;
            if constexpr (std::is_void_v<TResult>) {
                Call();
                return TValue{};
            } else {
                return MakeValue(Call());
            }
        }

        /// Вызов с данными аргументами возможен и возвращает void или
        /// значение, приводимое к TValue.
        template <typename TFn, typename... TCallArgs>
        concept ListenerShape =
            std::is_invocable_v<std::decay_t<TFn>&, TCallArgs...> &&
            (std::is_void_v<std::invoke_result_t<std::decay_t<TFn>&, TCallArgs...>> ||
             ValueConvertible<std::invoke_result_t<std::decay_t<TFn>&, TCallArgs...>>);

    } // namespace NInternal

    /// Вызываемое, которое можно зарегистрировать как слушателя.
    /// Поддерживаются три формы: (TEventEmitter&, const TArgs&), (const TArgs&) и ().
    template <typename TFn>
    concept ListenerCallable =
        NInternal::ListenerShape<TFn, TEventEmitter&, const TArgs&> ||
        NInternal::ListenerShape<TFn, const TArgs&> ||
        NInternal::ListenerShape<TFn>;

    /// Дескриптор слушателя.
    ///
    /// Слушатели из указателей на функции (и на члены) сравниваются по
    /// значению указателя: &Fn, переданный дважды, - один и тот же слушатель.
    /// Для остальных вызываемых идентичность определяется общим объектом
    /// функции: одинаковы только копии одного дескриптора.
    class TListener {
    public:
        using TFunction = std::function<TValue(TEventEmitter&, const TArgs&)>;

        TListener() = default;

        template <typename TFn>
            requires(!std::is_same_v<std::remove_cvref_t<TFn>, TListener> && ListenerCallable<TFn>)
        TListener(TFn&& Fn) {
            using TDecayed = std::decay_t<TFn>;

            if constexpr (std::is_pointer_v<TDecayed> || std::is_member_pointer_v<TDecayed>) {
                const TDecayed Target = Fn;
                if (!Target) {
                    return;
                }
                Key = std::make_shared<const TDecayed>(Target);
                KeyType = &typeid(TDecayed);
                KeyEqual = &EqualTargets<TDecayed>;
            }

            Function = MakeFunction(std::forward<TFn>(Fn));
        }

        explicit operator bool() const noexcept {
            return static_cast<bool>(Function);
        }

        TValue operator()(TEventEmitter& Emitter, const TArgs& Args) const {
            return (*Function)(Emitter, Args);
        }

        /// Адрес общего объекта функции, для логов.
        const void* Address() const noexcept {
            return Function.get();
        }

        friend bool operator==(const TListener& Lhs, const TListener& Rhs) noexcept {
            if (Lhs.KeyType && Rhs.KeyType) {
                return *Lhs.KeyType == *Rhs.KeyType && Lhs.KeyEqual(Lhs.Key.get(), Rhs.Key.get());
            }
            return Lhs.Function == Rhs.Function;
        }

    private:
        template <typename TTarget>
        static bool EqualTargets(const void* Lhs, const void* Rhs) {
            return *static_cast<const TTarget*>(Lhs) == *static_cast<const TTarget*>(Rhs);
        }

        template <typename TFn>
        static std::shared_ptr<const TFunction> MakeFunction(TFn&& Fn) {
            using TDecayed = std::decay_t<TFn>;

            if constexpr (NInternal::TIsStdFunction<TDecayed>::value) {
                if (!Fn) {
                    return nullptr;
                }
            }

            if constexpr (NInternal::ListenerShape<TFn, TEventEmitter&, const TArgs&>) {
                return std::make_shared<const TFunction>(
                    [Callback = TDecayed(std::forward<TFn>(Fn))](TEventEmitter& Emitter, const TArgs& Args) mutable {
                        return NInternal::InvokeToValue([&] { return std::invoke(Callback, Emitter, Args); });
                    });
            } else if constexpr (NInternal::ListenerShape<TFn, const TArgs&>) {
                return std::make_shared<const TFunction>(
                    [Callback = TDecayed(std::forward<TFn>(Fn))](TEventEmitter&, const TArgs& Args) mutable {
                        return NInternal::InvokeToValue([&] { return std::invoke(Callback, Args); });
                    });
            } else {
                return std::make_shared<const TFunction>(
                    [Callback = TDecayed(std::forward<TFn>(Fn))](TEventEmitter&, const TArgs&) mutable {
                        return NInternal::InvokeToValue([&] { return std::invoke(Callback); });
                    });
            }
        }

        std::shared_ptr<const TFunction> Function;

        // Ключ сравнения для указателей на функции, пустой для замыканий
        std::shared_ptr<const void> Key;
        const std::type_info* KeyType = nullptr;
        bool (*KeyEqual)(const void*, const void*) = nullptr;
    };


    /// Запись в списке слушателей события.
    struct TListenerRecord {
        TListenerRecord(TListener listener, bool fireOnce)
            : Listener(std::move(listener))
            , FireOnce(fireOnce) {
        }

        TListener Listener;
        bool FireOnce;
    };

    /// Слушатель в том виде, в каком его передают снаружи:
    /// голый дескриптор или уже готовая запись.
    using TListenerArg = std::variant<TListener, TListenerRecord>;

    /// Упорядоченный список слушателей одного события.
    using TListenerList = std::vector<TListenerRecord>;

    /// Ключ события -> копия его списка, в порядке таблицы.
    using TListenerMap = std::vector<std::pair<std::string, TListenerList>>;

    namespace NInternal {

        inline constexpr std::ptrdiff_t KNotFound = -1;

        /// Индекс последней записи с данным слушателем, KNotFound если нет.
        inline std::ptrdiff_t IndexOfListener(const TListenerList& Listeners,
                                              const TListener& Listener) {
            for (auto i = static_cast<std::ptrdiff_t>(Listeners.size()); i-- > 0;) {
                if (Listeners[static_cast<std::size_t>(i)].Listener == Listener) {
                    return i;
                }
            }
            return KNotFound;
        }

        /// Удаляет последнюю запись с данным слушателем.
        /// Возвращает true, если запись нашлась.
        inline bool RemoveListener(TListenerList& Listeners, const TListener& Listener) {
            const auto Index = IndexOfListener(Listeners, Listener);
            if (Index == KNotFound) {
                return false;
            }
            Listeners.erase(Listeners.begin() + Index);
            return true;
        }

    } // namespace NInternal
} // namespace NEventEmitter
