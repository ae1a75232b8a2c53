#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace replicator {

// Table key: integer (array-like index) or string.
using key = std::variant<std::int64_t, std::string>;

class value;

// Ordered so that diffs and encodings are deterministic.
using table = std::map<key, value>;

// Tagged tree node: a scalar or a nested table.
class value {
public:
    using storage = std::variant<bool, std::int64_t, double, std::string, table>;

    value() : m_data(table{}) {}
    value(bool b) : m_data(b) {}
    value(int i) : m_data(static_cast<std::int64_t>(i)) {}
    value(std::int64_t i) : m_data(i) {}
    value(double d) : m_data(d) {}
    value(const char* s) : m_data(std::string(s)) {}
    value(std::string s) : m_data(std::move(s)) {}
    value(table t) : m_data(std::move(t)) {}

    bool is_table() const { return std::holds_alternative<table>(m_data); }
    bool is_bool() const { return std::holds_alternative<bool>(m_data); }
    bool is_int() const { return std::holds_alternative<std::int64_t>(m_data); }
    bool is_double() const { return std::holds_alternative<double>(m_data); }
    bool is_string() const { return std::holds_alternative<std::string>(m_data); }

    // Accessors throw std::bad_variant_access on kind mismatch.
    table& as_table() { return std::get<table>(m_data); }
    const table& as_table() const { return std::get<table>(m_data); }
    bool as_bool() const { return std::get<bool>(m_data); }
    std::int64_t as_int() const { return std::get<std::int64_t>(m_data); }
    double as_double() const { return std::get<double>(m_data); }
    const std::string& as_string() const { return std::get<std::string>(m_data); }

    table* table_if() { return std::get_if<table>(&m_data); }
    const table* table_if() const { return std::get_if<table>(&m_data); }

    const storage& data() const { return m_data; }

    friend bool operator==(const value& a, const value& b) { return a.m_data == b.m_data; }
    friend bool operator!=(const value& a, const value& b) { return !(a == b); }

private:
    storage m_data;
};

// Human readable rendering for logs, e.g. {Currencies: {Money: 15}}
std::string to_string(const key& k);
std::string to_string(const value& v);
std::string to_string(const table& t);

} // namespace replicator
