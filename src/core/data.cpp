#include "walrus/core/data.hpp"

#include <utility>

namespace walrus::core {

namespace {
const std::shared_ptr<const std::string>& empty_buffer() {
    static const auto empty = std::make_shared<const std::string>();
    return empty;
}
}  // namespace

Bytes::Bytes() : buf_(empty_buffer()) {}

Bytes::Bytes(std::string data) : buf_(std::make_shared<const std::string>(std::move(data))) {}

Data Data::bytes(std::string data) {
    return Data(Value(std::in_place_type<Bytes>, std::move(data)));
}

Data Data::bytes(Bytes data) {
    return Data(Value(std::in_place_type<Bytes>, std::move(data)));
}

Data Data::string(std::string text) {
    return Data(Value(std::in_place_type<std::string>, std::move(text)));
}

Data Data::integer(uint64_t value) {
    return Data(Value(std::in_place_type<uint64_t>, value));
}

Data Data::list(List items) {
    return Data(Value(std::in_place_type<List>, std::move(items)));
}

DataKind Data::kind() const noexcept {
    // variant index follows the order of the alternatives in Value
    return static_cast<DataKind>(value_.index());
}

const Bytes& Data::as_bytes() const {
    return std::get<Bytes>(value_);
}

const std::string& Data::as_string() const {
    return std::get<std::string>(value_);
}

uint64_t Data::as_integer() const {
    return std::get<uint64_t>(value_);
}

const Data::List& Data::as_list() const {
    return std::get<List>(value_);
}

Data::List& Data::as_list() {
    return std::get<List>(value_);
}

bool Data::operator==(const Data& other) const {
    return value_ == other.value_;
}

}  // namespace walrus::core
