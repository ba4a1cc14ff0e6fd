#ifndef WALRUS_CORE_DATA_HPP
#define WALRUS_CORE_DATA_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace walrus::core {

/*
    immutable, reference counted byte buffer.
    copying a Bytes only bumps a refcount, so handing a value out of the store under the lock is
    cheap no matter how large the payload is.
*/
class Bytes {
   public:
    Bytes();
    explicit Bytes(std::string data);

    [[nodiscard]] const std::string& str() const noexcept {
        return *buf_;
    }
    [[nodiscard]] std::string_view view() const noexcept {
        return *buf_;
    }
    [[nodiscard]] std::size_t size() const noexcept {
        return buf_->size();
    }
    [[nodiscard]] bool empty() const noexcept {
        return buf_->empty();
    }

    bool operator==(const Bytes& other) const noexcept {
        return view() == other.view();
    }
    bool operator!=(const Bytes& other) const noexcept {
        return !(*this == other);
    }

   private:
    std::shared_ptr<const std::string> buf_;
};

enum class DataKind : uint8_t {
    Bytes,
    String,
    Integer,
    List,
};

// value held in the store for one key
class Data {
   public:
    using List = std::vector<Data>;

    static Data bytes(std::string data);
    static Data bytes(Bytes data);
    static Data string(std::string text);
    static Data integer(uint64_t value);
    static Data list(List items);

    [[nodiscard]] DataKind kind() const noexcept;
    [[nodiscard]] bool is(DataKind kind) const noexcept {
        return this->kind() == kind;
    }

    // wrong-kind access throws std::bad_variant_access
    [[nodiscard]] const Bytes& as_bytes() const;
    [[nodiscard]] const std::string& as_string() const;
    [[nodiscard]] uint64_t as_integer() const;
    [[nodiscard]] const List& as_list() const;
    [[nodiscard]] List& as_list();

    bool operator==(const Data& other) const;
    bool operator!=(const Data& other) const {
        return !(*this == other);
    }

   private:
    using Value = std::variant<Bytes, std::string, uint64_t, List>;

    explicit Data(Value value) : value_(std::move(value)) {}

    Value value_;
};

}  // namespace walrus::core

#endif
