#include "walrus/cmd/command.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <utility>

#include "walrus/error.hpp"

namespace walrus::cmd {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// variant visitor helper
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

// PING ---------------------------------------------------------------------------------------

Ping Ping::parse_frames(Parse& parse) {
    Ping ping;
    try {
        ping.msg = parse.next_bytes();
    } catch (const EndOfStream&) {
        // no message, plain PONG
    }
    parse.finish();
    return ping;
}

net::Frame Ping::apply() const {
    if (!msg.has_value()) {
        return net::Frame::simple("PONG");
    }
    return net::Frame::bulk(msg.value());
}

net::Frame Ping::into_frame() const {
    net::FrameArrayBuilder builder;
    builder.push_bulk("ping");
    if (msg.has_value()) {
        builder.push_bulk(msg.value());
    }
    return std::move(builder).build();
}

// GET ----------------------------------------------------------------------------------------

Get Get::parse_frames(Parse& parse) {
    Get get;
    get.key = parse.next_string();
    parse.finish();
    return get;
}

net::Frame Get::apply(const core::Db& db) const {
    auto value = db.get(key);
    if (!value.has_value()) {
        return net::Frame::null();
    }

    switch (value->kind()) {
        case core::DataKind::Bytes:
            return net::Frame::bulk(value->as_bytes().str());
        case core::DataKind::String:
            return net::Frame::bulk(value->as_string());
        case core::DataKind::Integer:
            return net::Frame::integer(value->as_integer());
        case core::DataKind::List:
            break;
    }
    return net::Frame::error("operation against a key holding the wrong kind of value");
}

net::Frame Get::into_frame() const {
    net::FrameArrayBuilder builder;
    builder.push_bulk("get").push_bulk(key);
    return std::move(builder).build();
}

// SET ----------------------------------------------------------------------------------------

Set Set::parse_frames(Parse& parse) {
    Set set;
    set.key = parse.next_string();
    set.value = parse.next_bytes();

    std::string option;
    try {
        option = to_upper(parse.next_string());
    } catch (const EndOfStream&) {
        // no options, the key never expires
        return set;
    }

    if (option == "EX") {
        uint64_t secs = parse.next_int();
        if (secs > static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(core::kMaxTtl).count())) {
            throw CommandError("invalid expire time in 'set' command");
        }
        set.expire = std::chrono::duration_cast<util::Duration>(
            std::chrono::seconds(static_cast<std::chrono::seconds::rep>(secs)));
    } else if (option == "PX") {
        uint64_t ms = parse.next_int();
        if (ms > static_cast<uint64_t>(core::kMaxTtl.count())) {
            throw CommandError("invalid expire time in 'set' command");
        }
        set.expire = util::Duration(static_cast<util::Duration::rep>(ms));
    } else {
        throw CommandError("only supports expiration option");
    }

    parse.finish();
    return set;
}

net::Frame Set::apply(core::Db& db) const {
    // SET always overwrites, whatever kind of value was there before
    db.set(key, core::Data::bytes(value), expire);
    return net::Frame::simple("OK");
}

net::Frame Set::into_frame() const {
    net::FrameArrayBuilder builder;
    builder.push_bulk("set").push_bulk(key).push_bulk(value);
    if (expire.has_value()) {
        // milliseconds keep full precision; EX would round
        builder.push_bulk("px").push_bulk(std::to_string(expire->count()));
    }
    return std::move(builder).build();
}

// RPUSH --------------------------------------------------------------------------------------

RPush RPush::parse_frames(Parse& parse) {
    RPush rpush;
    rpush.key = parse.next_string();
    rpush.items = parse.next_array();
    if (rpush.items.empty()) {
        throw ParseError("wrong number of arguments for 'rpush' command");
    }
    return rpush;
}

/*
    note: a key holding something other than a list answers 0 and keeps its value. the items are
    dropped on purpose - 0 tells the caller nothing was appended without failing the request.
*/
net::Frame RPush::apply(core::Db& db) const {
    return net::Frame::integer(db.rpush(key, items));
}

net::Frame RPush::into_frame() const {
    net::FrameArrayBuilder builder;
    builder.push_bulk("rpush").push_bulk(key).push_data(items);
    return std::move(builder).build();
}

// UNKNOWN ------------------------------------------------------------------------------------

net::Frame Unknown::apply() const {
    // the name came off the wire as a bulk string and may hold line breaks
    std::string shown = name;
    std::replace(shown.begin(), shown.end(), '\r', ' ');
    std::replace(shown.begin(), shown.end(), '\n', ' ');
    return net::Frame::error("unknown command " + shown);
}

net::Frame Unknown::into_frame() const {
    net::FrameArrayBuilder builder;
    builder.push_bulk(name);
    return std::move(builder).build();
}

// COMMAND ------------------------------------------------------------------------------------

Command Command::from_frame(net::Frame frame) {
    Parse parse(std::move(frame));

    // command names are case insensitive
    std::string name = to_lower(parse.next_string());

    if (name == "ping") {
        return Command(Ping::parse_frames(parse));
    }
    if (name == "get") {
        return Command(Get::parse_frames(parse));
    }
    if (name == "set") {
        return Command(Set::parse_frames(parse));
    }
    if (name == "rpush") {
        return Command(RPush::parse_frames(parse));
    }
    // arguments of an unknown command are left unread
    return Command(Unknown{std::move(name)});
}

net::Frame Command::apply(core::Db& db) const {
    return std::visit(overloaded{
                          [](const Ping& cmd) { return cmd.apply(); },
                          [&db](const Get& cmd) { return cmd.apply(db); },
                          [&db](const Set& cmd) { return cmd.apply(db); },
                          [&db](const RPush& cmd) { return cmd.apply(db); },
                          [](const Unknown& cmd) { return cmd.apply(); },
                      },
                      command_);
}

void Command::execute(core::Db& db, net::Connection& connection) const {
    connection.write_frame(apply(db));
}

net::Frame Command::into_frame() const {
    return std::visit([](const auto& cmd) { return cmd.into_frame(); }, command_);
}

std::string_view Command::name() const {
    return std::visit(overloaded{
                          [](const Ping&) -> std::string_view { return "ping"; },
                          [](const Get&) -> std::string_view { return "get"; },
                          [](const Set&) -> std::string_view { return "set"; },
                          [](const RPush&) -> std::string_view { return "rpush"; },
                          [](const Unknown& cmd) -> std::string_view { return cmd.name; },
                      },
                      command_);
}

}  // namespace walrus::cmd
