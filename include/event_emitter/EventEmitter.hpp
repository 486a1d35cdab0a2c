#pragma once

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "event_emitter/internal/Listener.hpp"
#include "event_emitter/internal/EventTable.hpp"

namespace NEventEmitter {

    /// Бросается при попытке добавить пустого слушателя.
    class TInvalidListenerError: public std::invalid_argument {
    public:
        TInvalidListenerError()
            : std::invalid_argument("listener must be a function") {
        }
    };

    /// Значение для карты TEventMap: один слушатель или список.
    using TEventMapValue = std::variant<TListenerArg, std::vector<TListenerArg>>;

    /// Ключ события -> слушатель(и), для массовых операций сразу над несколькими событиями.
    using TEventMap = std::vector<std::pair<std::string, TEventMapValue>>;

    /// Селектор массовых операций: точный ключ, шаблон или карта.
    using TEventSelector = std::variant<std::string, TPattern, TEventMap>;

    struct TEmitterOptions {
        /// Слушатель, вернувший это значение, удаляется после вызова.
        TValue OnceReturnValue = true;

        /// nullptr означает spdlog::default_logger().
        std::shared_ptr<spdlog::logger> Logger;
    };

    /// Реестр событий.
    ///
    /// Все вызовы синхронные. Слушатели получают сам эмиттер и аргументы
    /// и могут вызывать любые его методы, включая вложенный EmitEvent.
    /// Эмиттер не потокобезопасен: при общем доступе из нескольких потоков
    /// все вызовы нужно закрывать внешним мьютексом.
    ///
    /// Исключение из слушателя не перехватывается: оно уходит к вызывающему
    /// EmitEvent/Emit, а оставшиеся слушатели этого прохода не вызываются.
    class TEventEmitter {
    public:
        /// RAII-обёртка, снимающая слушателя при разрушении.
        class TScopedListener {
        public:
            TScopedListener() = default;

            TScopedListener(TEventEmitter& emitter, TEventId event, TListener listener)
                : Emitter(&emitter)
                , Event(std::move(event))
                , Listener(std::move(listener)) {
            }

            TScopedListener(const TScopedListener&) = delete;
            TScopedListener& operator=(const TScopedListener&) = delete;

            TScopedListener(TScopedListener&& other) noexcept
                : Emitter(other.Emitter)
                , Event(std::move(other.Event))
                , Listener(std::move(other.Listener)) {
                other.Emitter = nullptr;
            }

            TScopedListener& operator=(TScopedListener&& other) noexcept {
                if (this != &other) {
                    Disconnect();
                    Emitter = other.Emitter;
                    Event = std::move(other.Event);
                    Listener = std::move(other.Listener);
                    other.Emitter = nullptr;
                }
                return *this;
            }

            ~TScopedListener() {
                Disconnect();
            }

            void Disconnect() {
                if (Emitter && Listener) {
                    Emitter->RemoveListener(Event, Listener);
                }
                Emitter = nullptr;
            }

            /// Отвязывает обёртку, оставляя слушателя зарегистрированным.
            TListener Release() {
                Emitter = nullptr;
                return std::exchange(Listener, TListener{});
            }

        private:
            TEventEmitter* Emitter = nullptr;
            TEventId Event;
            TListener Listener;
        };

        TEventEmitter()
            : TEventEmitter(TEmitterOptions{}) {
        }

        explicit TEventEmitter(TEmitterOptions Options)
            : OnceReturnValue(std::move(Options.OnceReturnValue))
            , Logger(Options.Logger ? std::move(Options.Logger) : spdlog::default_logger()) {
        }

        TEventEmitter(const TEventEmitter&) = delete;
        TEventEmitter& operator=(const TEventEmitter&) = delete;

        // --------- Поиск ---------

        /// Живой список слушателей события; отсутствующее событие создаётся пустым.
        TListenerList& GetListeners(const std::string& Event) {
            return Events.Materialize(Event);
        }

        /// Списки всех уже существующих событий, подходящих под шаблон.
        /// Новых событий не создаёт.
        TListenerMap GetListeners(const TPattern& Pattern) const {
            TListenerMap Result;
            for (auto& Key : Events.MatchingKeys(Pattern)) {
                const TListenerList* Listeners = Events.Find(Key);
                Result.emplace_back(std::move(Key), *Listeners);
            }
            return Result;
        }

        /// То же, что GetListeners, но всегда в виде карты ключ -> список.
        TListenerMap GetListenersAsObject(const TEventId& Event) {
            if (const auto* Pattern = std::get_if<TPattern>(&Event)) {
                return GetListeners(*Pattern);
            }

            const auto& Key = std::get<std::string>(Event);
            TListenerMap Result;
            Result.emplace_back(Key, GetListeners(Key));
            return Result;
        }

        static bool IsValidListener(const TListenerArg& Listener) {
            if (const auto* Record = std::get_if<TListenerRecord>(&Listener)) {
                return static_cast<bool>(Record->Listener);
            }
            return static_cast<bool>(std::get<TListener>(Listener));
        }

        static std::vector<TListener> FlattenListeners(const TListenerList& Listeners) {
            std::vector<TListener> Result;
            Result.reserve(Listeners.size());
            for (const auto& Record : Listeners) {
                Result.push_back(Record.Listener);
            }
            return Result;
        }

        /// Количество слушателей события. Событие не создаётся.
        std::size_t GetListenerCount(const std::string& Event) const {
            const TListenerList* Listeners = Events.Find(Event);
            return Listeners ? Listeners->size() : 0;
        }

        bool HasEvent(const std::string& Event) const {
            return Events.Find(Event) != nullptr;
        }

        /// Имена событий в порядке таблицы.
        std::vector<std::string> GetEventNames() const {
            return Events.Keys();
        }

        // --------- Добавление и удаление ---------

        /// Добавляет слушателя ко всем событиям, которые даёт Event.
        /// Уже добавленный к событию слушатель повторно не добавляется,
        /// независимо от флага FireOnce.
        TEventEmitter& AddListener(const TEventId& Event, TListenerArg Listener) {
            if (!IsValidListener(Listener)) {
                throw TInvalidListenerError();
            }

            TListenerRecord Record = Normalize(std::move(Listener));

            const auto Keys = ResolveKeys(Event);
            Logger->trace("event_emitter: adding listener {} to {} ({} event(s))",
                          Record.Listener.Address(), FormatEventId(Event), Keys.size());

            for (const auto& Key : Keys) {
                TListenerList& Listeners = Events.Materialize(Key);
                if (NInternal::IndexOfListener(Listeners, Record.Listener) != NInternal::KNotFound) {
                    continue;
                }

                Listeners.push_back(Record);
                Logger->trace("event_emitter: added listener {} to '{}' (once={})",
                              Record.Listener.Address(), Key, Record.FireOnce);
            }

            return *this;
        }

        TEventEmitter& AddOnceListener(const TEventId& Event, TListener Listener) {
            return AddListener(Event, TListenerRecord(std::move(Listener), true));
        }

        /// Создаёт пустое событие, чтобы его находили шаблоны.
        TEventEmitter& DefineEvent(const std::string& Event) {
            if (!Events.Find(Event)) {
                Events.Materialize(Event);
                Logger->debug("event_emitter: defined event '{}'", Event);
            }
            return *this;
        }

        TEventEmitter& DefineEvents(const std::vector<std::string>& EventNames) {
            for (const auto& Event : EventNames) {
                DefineEvent(Event);
            }
            return *this;
        }

        /// Снимает слушателя со всех событий, которые даёт Event.
        /// Отсутствующий слушатель не ошибка.
        TEventEmitter& RemoveListener(const TEventId& Event, const TListenerArg& Listener) {
            const TListener& Target = UnderlyingListener(Listener);

            for (const auto& Key : ResolveKeys(Event)) {
                RemoveFromEvent(Key, Target);
            }

            return *this;
        }

        TEventEmitter& AddListeners(const TEventSelector& Selector,
                                    const std::vector<TListenerArg>& Listeners = {}) {
            return ManipulateListeners(false, Selector, Listeners);
        }

        TEventEmitter& RemoveListeners(const TEventSelector& Selector,
                                       const std::vector<TListenerArg>& Listeners = {}) {
            return ManipulateListeners(true, Selector, Listeners);
        }

        /// Массовое добавление (Remove == false) или удаление (Remove == true).
        ///
        /// Для TEventMap каждое значение обрабатывается отдельно: один слушатель
        /// идёт в AddListener/RemoveListener, список - в AddListeners/RemoveListeners.
        /// Для ключа или шаблона Listeners обходятся с конца.
        TEventEmitter& ManipulateListeners(bool Remove,
                                           const TEventSelector& Selector,
                                           const std::vector<TListenerArg>& Listeners) {
            std::visit(
                [&](const auto& Target) {
                    using TTarget = std::decay_t<decltype(Target)>;

                    if constexpr (std::is_same_v<TTarget, TEventMap>) {
                        for (const auto& [Key, Value] : Target) {
                            if (const auto* Single = std::get_if<TListenerArg>(&Value)) {
                                ApplySingle(Remove, Key, *Single);
                            } else if (Remove) {
                                RemoveListeners(Key, std::get<std::vector<TListenerArg>>(Value));
                            } else {
                                AddListeners(Key, std::get<std::vector<TListenerArg>>(Value));
                            }
                        }
                    } else {
                        const TEventId Event{Target};
                        for (auto It = Listeners.rbegin(); It != Listeners.rend(); ++It) {
                            ApplySingle(Remove, Event, *It);
                        }
                    }
                },
                Selector);

            return *this;
        }

        /// Удаляет событие целиком (или все события под шаблон).
        TEventEmitter& RemoveEvent(const TEventId& Event) {
            std::size_t Erased = 0;
            if (const auto* Pattern = std::get_if<TPattern>(&Event)) {
                Erased = Events.EraseMatching(*Pattern);
            } else if (Events.Erase(std::get<std::string>(Event))) {
                Erased = 1;
            }
            Logger->debug("event_emitter: removed {} event(s) for {}", Erased, FormatEventId(Event));
            return *this;
        }

        /// Удаляет все события.
        TEventEmitter& RemoveEvent() {
            Logger->debug("event_emitter: removed all {} event(s)", Events.Size());
            Events.Clear();
            return *this;
        }

        // --------- Диспетчеризация ---------

        /// Вызывает слушателей всех событий, которые даёт Event.
        ///
        /// Каждое событие обходится по копии своего списка: слушатели,
        /// добавленные или снятые во время прохода, учитываются только со
        /// следующего вызова. FireOnce-слушатель снимается до вызова,
        /// слушатель, вернувший OnceReturnValue, - после.
        TEventEmitter& EmitEvent(const TEventId& Event, const TArgs& Args = {}) {
            const auto Keys = ResolveKeys(Event);
            Logger->trace("event_emitter: emit {} resolved to {} event(s)", FormatEventId(Event), Keys.size());

            for (const auto& Key : Keys) {
                const TListenerList* Live = Events.Find(Key);
                if (!Live) {
                    // событие удалил один из предыдущих слушателей
                    continue;
                }

                const TListenerList Snapshot = *Live;
                Logger->trace("event_emitter: emitting '{}' to {} listener(s)", Key, Snapshot.size());

                for (const auto& Record : Snapshot) {
                    if (Record.FireOnce) {
                        RemoveFromEvent(Key, Record.Listener);
                    }

                    TValue Response;
                    try {
                        Response = Record.Listener(*this, Args);
                    } catch (...) {
                        Logger->debug("event_emitter: listener {} of '{}' threw, dispatch aborted",
                                      Record.Listener.Address(), Key);
                        throw;
                    }

                    if (Response == OnceReturnValue) {
                        RemoveFromEvent(Key, Record.Listener);
                    }
                }
            }

            return *this;
        }

        template <typename... TArgTypes>
        TEventEmitter& Emit(const TEventId& Event, TArgTypes&&... Args) {
            TArgs Packed;
            Packed.reserve(sizeof...(TArgTypes));
            (Packed.push_back(MakeValue(std::forward<TArgTypes>(Args))), ...);
            return EmitEvent(Event, Packed);
        }

        // --------- Настройка ---------

        TEventEmitter& SetOnceReturnValue(TValue Value) {
            OnceReturnValue = std::move(Value);
            Logger->debug("event_emitter: once return value changed");
            return *this;
        }

        const TValue& GetOnceReturnValue() const noexcept {
            return OnceReturnValue;
        }

        TEventEmitter& SetLogger(std::shared_ptr<spdlog::logger> NewLogger) {
            Logger = NewLogger ? std::move(NewLogger) : spdlog::default_logger();
            return *this;
        }

        const std::shared_ptr<spdlog::logger>& GetLogger() const noexcept {
            return Logger;
        }

        // --------- Синонимы ---------

        TEventEmitter& On(const TEventId& Event, TListenerArg Listener) {
            return AddListener(Event, std::move(Listener));
        }

        TEventEmitter& Once(const TEventId& Event, TListener Listener) {
            return AddOnceListener(Event, std::move(Listener));
        }

        TEventEmitter& Off(const TEventId& Event, const TListenerArg& Listener) {
            return RemoveListener(Event, Listener);
        }

        TEventEmitter& RemoveAllListeners(const TEventId& Event) {
            return RemoveEvent(Event);
        }

        TEventEmitter& RemoveAllListeners() {
            return RemoveEvent();
        }

        TEventEmitter& Trigger(const TEventId& Event, const TArgs& Args = {}) {
            return EmitEvent(Event, Args);
        }

    private:
        /// Ключи, на которые указывает Event. Точный ключ создаётся,
        /// шаблон выбирает только существующие.
        std::vector<std::string> ResolveKeys(const TEventId& Event) {
            if (const auto* Pattern = std::get_if<TPattern>(&Event)) {
                return Events.MatchingKeys(*Pattern);
            }

            const auto& Key = std::get<std::string>(Event);
            Events.Materialize(Key);
            return {Key};
        }

        void RemoveFromEvent(const std::string& Key, const TListener& Listener) {
            TListenerList* Listeners = Events.Find(Key);
            if (Listeners && NInternal::RemoveListener(*Listeners, Listener)) {
                Logger->trace("event_emitter: removed listener {} from '{}'", Listener.Address(), Key);
            }
        }

        void ApplySingle(bool Remove, const TEventId& Event, const TListenerArg& Listener) {
            if (Remove) {
                RemoveListener(Event, Listener);
            } else {
                AddListener(Event, Listener);
            }
        }

        static const TListener& UnderlyingListener(const TListenerArg& Listener) {
            if (const auto* Record = std::get_if<TListenerRecord>(&Listener)) {
                return Record->Listener;
            }
            return std::get<TListener>(Listener);
        }

        static TListenerRecord Normalize(TListenerArg Listener) {
            if (auto* Record = std::get_if<TListenerRecord>(&Listener)) {
                return std::move(*Record);
            }
            return TListenerRecord(std::get<TListener>(std::move(Listener)), false);
        }

        // --------- Данные ---------

        NInternal::TEventTable Events;
        TValue OnceReturnValue;
        std::shared_ptr<spdlog::logger> Logger;
    };

    using TScopedListener = TEventEmitter::TScopedListener;

} // namespace NEventEmitter
