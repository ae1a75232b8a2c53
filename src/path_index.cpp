#include "path_index.hpp"
#include <charconv>
#include <stdexcept>

namespace replicator {

const value* resolve(const table& root, const path& p) {
    const table* current = &root;
    const value* found = nullptr;

    for (const auto& k : p) {
        if (!current) return nullptr;

        auto it = current->find(k);
        if (it == current->end()) return nullptr;

        found = &it->second;
        current = found->table_if();
    }
    return found;
}

const value* resolve(const value& root, const path& p) {
    if (p.empty()) return &root;

    const table* t = root.table_if();
    if (!t) return nullptr;
    return resolve(*t, p);
}

std::optional<value> lookup(const value& root, const path& p) {
    if (const value* v = resolve(root, p)) return *v;
    return std::nullopt;
}

void assign(table& root, const path& p, value v) {
    if (p.empty()) throw std::invalid_argument("path: cannot assign to the root");

    table* current = &root;
    for (std::size_t i = 0; i + 1 < p.size(); ++i) {
        value& next = (*current)[p[i]];
        if (!next.is_table()) next = table{};
        current = &next.as_table();
    }
    (*current)[p.back()] = std::move(v);
}

bool erase(table& root, const path& p) {
    if (p.empty()) return false;

    table* current = &root;
    for (std::size_t i = 0; i + 1 < p.size(); ++i) {
        auto it = current->find(p[i]);
        if (it == current->end()) return false;
        current = it->second.table_if();
        if (!current) return false;
    }
    return current->erase(p.back()) > 0;
}

static key parse_segment(const std::string& segment) {
    if (segment.empty()) return segment;

    std::int64_t index = 0;
    const char* first = segment.data();
    const char* last = first + segment.size();
    auto [ptr, ec] = std::from_chars(first, last, index);
    if (ec == std::errc{} && ptr == last) return index;
    return segment;
}

path parse_path(const std::string& dotted) {
    path result;
    if (dotted.empty()) return result;

    std::size_t start = 0;
    while (true) {
        auto dot = dotted.find('.', start);
        if (dot == std::string::npos) {
            result.push_back(parse_segment(dotted.substr(start)));
            break;
        }
        result.push_back(parse_segment(dotted.substr(start, dot - start)));
        start = dot + 1;
    }
    return result;
}

std::string format_path(const path& p) {
    std::string out;
    for (std::size_t i = 0; i < p.size(); ++i) {
        if (i > 0) out += '.';
        out += to_string(p[i]);
    }
    return out;
}

} // namespace replicator
