#ifndef WALRUS_CMD_COMMAND_HPP
#define WALRUS_CMD_COMMAND_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "walrus/cmd/parse.hpp"
#include "walrus/core/data.hpp"
#include "walrus/core/db.hpp"
#include "walrus/net/connection.hpp"
#include "walrus/net/frame.hpp"
#include "walrus/util/types.hpp"

namespace walrus::cmd {

/*
    each command knows how to:
        parse_frames  read its arguments off a Parse cursor (server side)
        apply         run against the store and produce the reply frame
        into_frame    turn itself back into a request frame (client side)
*/

// PING [message]
struct Ping {
    std::optional<std::string> msg;

    static Ping parse_frames(Parse& parse);
    [[nodiscard]] net::Frame apply() const;
    [[nodiscard]] net::Frame into_frame() const;
};

// GET key
struct Get {
    std::string key;

    static Get parse_frames(Parse& parse);
    [[nodiscard]] net::Frame apply(const core::Db& db) const;
    [[nodiscard]] net::Frame into_frame() const;
};

// SET key value [EX seconds | PX milliseconds]
struct Set {
    std::string key;
    std::string value;
    std::optional<util::Duration> expire;

    static Set parse_frames(Parse& parse);
    [[nodiscard]] net::Frame apply(core::Db& db) const;
    [[nodiscard]] net::Frame into_frame() const;
};

// RPUSH key item [item ...]
struct RPush {
    std::string key;
    std::vector<core::Data> items;

    static RPush parse_frames(Parse& parse);
    [[nodiscard]] net::Frame apply(core::Db& db) const;
    [[nodiscard]] net::Frame into_frame() const;
};

// anything else; the name is lower-cased
struct Unknown {
    std::string name;

    [[nodiscard]] net::Frame apply() const;
    [[nodiscard]] net::Frame into_frame() const;
};

class Command {
   public:
    using Variant = std::variant<Ping, Get, Set, RPush, Unknown>;

    explicit Command(Variant command) : command_(std::move(command)) {}

    /*
        decode a request frame. the command name is matched case-insensitively.
        throws ParseError (fatal to the connection) when the arguments don't fit the command and
        CommandError when a SET option is not supported.
    */
    static Command from_frame(net::Frame frame);

    [[nodiscard]] net::Frame apply(core::Db& db) const;

    // apply and write the reply
    void execute(core::Db& db, net::Connection& connection) const;

    [[nodiscard]] net::Frame into_frame() const;

    [[nodiscard]] std::string_view name() const;

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&command_);
    }

   private:
    Variant command_;
};

}  // namespace walrus::cmd

#endif
