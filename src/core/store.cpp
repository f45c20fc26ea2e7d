#include "respkv/core/store.hpp"

#include <utility>

namespace respkv::core {

class Store::Impl {
   public:
    void set(std::string_view key, std::string value) {
        data_[std::string(key)] = std::move(value);
    }

    [[nodiscard]] const StoredValue* find(std::string_view key) const {
        auto it = data_.find(std::string(key));
        if (it == data_.end()) {
            return nullptr;
        }
        return &it->second;
    }

    [[nodiscard]] Hash* get_or_create_hash(std::string_view key) {
        // try_emplace only constructs the empty hash when the key is new
        auto it = data_.try_emplace(std::string(key), std::in_place_type<Hash>).first;
        return std::get_if<Hash>(&it->second);
    }

    [[nodiscard]] bool contains(std::string_view key) const {
        return data_.contains(std::string(key));
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return data_.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        return data_.empty();
    }

    void clear() noexcept {
        data_.clear();
    }

   private:
    std::unordered_map<std::string, StoredValue> data_;
};

Store::Store() : impl_(std::make_unique<Impl>()) {}

Store::~Store() = default;

Store::Store(Store&&) noexcept = default;

Store& Store::operator=(Store&&) noexcept = default;

void Store::set(std::string_view key, std::string value) {
    impl_->set(key, std::move(value));
}

const StoredValue* Store::find(std::string_view key) const {
    return impl_->find(key);
}

Hash* Store::get_or_create_hash(std::string_view key) {
    return impl_->get_or_create_hash(key);
}

bool Store::contains(std::string_view key) const {
    return impl_->contains(key);
}

std::size_t Store::size() const noexcept {
    return impl_->size();
}

bool Store::empty() const noexcept {
    return impl_->empty();
}

void Store::clear() noexcept {
    impl_->clear();
}

}  // namespace respkv::core
