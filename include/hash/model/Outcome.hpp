#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace ssdw::hash::model {

struct Success {
    std::string digest;

    bool operator==(const Success&) const = default;
};

// ssdeep exited cleanly but printed no HASH,"FILENAME" line (e.g. file too small)
struct Notice {
    std::string text;

    bool operator==(const Notice&) const = default;
};

struct Error {
    int code = -1;
    std::string message;

    bool operator==(const Error&) const = default;
};

using Outcome = std::variant<Success, Notice, Error>;

template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// Artifact body for an outcome, without the trailing newline
std::string render(const Outcome& outcome);

std::string_view kindName(const Outcome& outcome);

}
