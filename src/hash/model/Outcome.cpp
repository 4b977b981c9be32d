#include "hash/model/Outcome.hpp"

#include <fmt/core.h>

namespace ssdw::hash::model {

std::string render(const Outcome& outcome) {
    return std::visit(Overloaded{
        [](const Success& s) -> std::string { return s.digest; },
        [](const Notice& n) -> std::string { return fmt::format("SSDeep notice: {}", n.text); },
        [](const Error& e) -> std::string { return fmt::format("Error running ssdeep (code {}): {}", e.code, e.message); }
    }, outcome);
}

std::string_view kindName(const Outcome& outcome) {
    return std::visit(Overloaded{
        [](const Success&) -> std::string_view { return "success"; },
        [](const Notice&) -> std::string_view { return "notice"; },
        [](const Error&) -> std::string_view { return "error"; }
    }, outcome);
}

}
