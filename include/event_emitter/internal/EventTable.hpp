#pragma once

#include <cstddef>
#include <iterator>
#include <list>
#include <regex>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "Listener.hpp"

namespace NEventEmitter {

    /// Шаблон имени события.
    /// Проверяется через std::regex_search, то есть совпадение с любой
    /// частью ключа (якоря ^ и $ задаются в самом шаблоне).
    /// Некорректный шаблон бросает std::regex_error из конструктора.
    class TPattern {
    public:
        explicit TPattern(std::string Source,
                          std::regex::flag_type Flags = std::regex::ECMAScript)
            : SourceV(std::move(Source))
            , Regex(SourceV, Flags) {
        }

        bool Matches(const std::string& Key) const {
            return std::regex_search(Key, Regex);
        }

        const std::string& Source() const noexcept {
            return SourceV;
        }

    private:
        std::string SourceV;
        std::regex Regex;
    };

    /// Идентификатор события: точный ключ или шаблон.
    using TEventId = std::variant<std::string, TPattern>;

    /// Строка для логов: ключ как есть, шаблон в виде /source/.
    inline std::string FormatEventId(const TEventId& Event) {
        if (const auto* Pattern = std::get_if<TPattern>(&Event)) {
            return "/" + Pattern->Source() + "/";
        }
        return std::get<std::string>(Event);
    }

    namespace NInternal {

        /// Таблица событий: ключ -> список слушателей.
        /// Ключи обходятся в порядке первого появления. Ссылки на списки
        /// остаются валидными до удаления соответствующего ключа.
        class TEventTable {
        public:
            TEventTable() = default;

            TEventTable(const TEventTable&) = delete;
            TEventTable& operator=(const TEventTable&) = delete;

            /// Список для ключа; отсутствующий ключ создаётся с пустым списком.
            TListenerList& Materialize(const std::string& Key) {
                auto It = Index.find(Key);
                if (It != Index.end()) {
                    return It->second->Listeners;
                }

                Entries.push_back(TEntry{Key, {}});
                auto EntryIt = std::prev(Entries.end());
                Index.emplace(Key, EntryIt);
                return EntryIt->Listeners;
            }

            TListenerList* Find(const std::string& Key) {
                auto It = Index.find(Key);
                return It == Index.end() ? nullptr : &It->second->Listeners;
            }

            const TListenerList* Find(const std::string& Key) const {
                auto It = Index.find(Key);
                return It == Index.end() ? nullptr : &It->second->Listeners;
            }

            /// Существующие ключи, подходящие под шаблон. Ничего не создаёт.
            std::vector<std::string> MatchingKeys(const TPattern& Pattern) const {
                std::vector<std::string> Keys;
                for (const auto& Entry : Entries) {
                    if (Pattern.Matches(Entry.Key)) {
                        Keys.push_back(Entry.Key);
                    }
                }
                return Keys;
            }

            std::vector<std::string> Keys() const {
                std::vector<std::string> Result;
                Result.reserve(Entries.size());
                for (const auto& Entry : Entries) {
                    Result.push_back(Entry.Key);
                }
                return Result;
            }

            bool Erase(const std::string& Key) {
                auto It = Index.find(Key);
                if (It == Index.end()) {
                    return false;
                }
                Entries.erase(It->second);
                Index.erase(It);
                return true;
            }

            std::size_t EraseMatching(const TPattern& Pattern) {
                std::size_t Erased = 0;
                for (auto It = Entries.begin(); It != Entries.end();) {
                    if (Pattern.Matches(It->Key)) {
                        Index.erase(It->Key);
                        It = Entries.erase(It);
                        ++Erased;
                    } else {
                        ++It;
                    }
                }
                return Erased;
            }

            void Clear() {
                Index.clear();
                Entries.clear();
            }

            [[nodiscard]] std::size_t Size() const noexcept {
                return Entries.size();
            }

        private:
            struct TEntry {
                std::string Key;
                TListenerList Listeners;
            };

            std::list<TEntry> Entries;
            std::unordered_map<std::string, std::list<TEntry>::iterator> Index;
        };

    } // namespace NInternal
} // namespace NEventEmitter
