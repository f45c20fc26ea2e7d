#ifndef RESPKV_CORE_STORE_HPP
#define RESPKV_CORE_STORE_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace respkv::core {

using Hash = std::unordered_map<std::string, std::string>;

// a key holds exactly one of these until it is overwritten
using StoredValue = std::variant<std::string, Hash>;

/*
    In-memory keyspace. Not synchronized: whoever owns the Store must make sure only one command
    touches it at a time (the server serves one connection at a time).
*/
class Store {
   public:
    Store();
    ~Store();

    // copying a whole keyspace should be explicit, moves are cheap through the pimpl
    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;
    Store(Store&&) noexcept;
    Store& operator=(Store&&) noexcept;

    // replaces whatever the key held, string or hash
    void set(std::string_view key, std::string value);

    // nullptr when absent. the pointer is invalidated by the next mutation
    [[nodiscard]] const StoredValue* find(std::string_view key) const;

    /*
        the hash stored at key, an empty one is created if the key is absent.
        nullptr when the key holds a string (no implicit conversion).
    */
    [[nodiscard]] Hash* get_or_create_hash(std::string_view key);

    [[nodiscard]] bool contains(std::string_view key) const;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

    void clear() noexcept;

   private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace respkv::core

#endif
