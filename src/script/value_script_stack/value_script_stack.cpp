/// @file value_script_stack.cpp
/// @brief ValueScriptStack implementation.

#include "interact/script/value_script_stack.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <utility>

namespace interact::script {

namespace {

bool isBlank(const char* p) {
    while (*p != '\0') {
        if (std::isspace(static_cast<unsigned char>(*p)) == 0) {
            return false;
        }
        ++p;
    }
    return true;
}

}  // namespace

std::optional<double> ParseScriptNumber(const std::string& text) {
    const char* begin = text.c_str();
    char* end = nullptr;

    double result = std::strtod(begin, &end);
    if (end == begin) {
        return std::nullopt;
    }
    // strtod stops at the 'x' of "0x1A"; the language reads the rest as hex.
    if (*end == 'x' || *end == 'X') {
        result = static_cast<double>(std::strtoul(begin, &end, 16));
    }
    if (!isBlank(end)) {
        return std::nullopt;
    }
    return result;
}

ValueScriptStack::ValueScriptStack(std::initializer_list<ScriptValue> args)
    : args_(args) {}

ValueScriptStack::ValueScriptStack(std::vector<ScriptValue> args)
    : args_(std::move(args)) {}

const ScriptValue* ValueScriptStack::argAt(int index) const noexcept {
    if (index < 1 || static_cast<std::size_t>(index) > args_.size()) {
        return nullptr;
    }
    return &args_[static_cast<std::size_t>(index) - 1];
}

int ValueScriptStack::GetTop() const {
    return static_cast<int>(args_.size());
}

bool ValueScriptStack::IsNumber(int index) const {
    const auto* value = argAt(index);
    if (value == nullptr) {
        return false;
    }
    if (std::holds_alternative<double>(*value)) {
        return true;
    }
    if (const auto* text = std::get_if<std::string>(value)) {
        return ParseScriptNumber(*text).has_value();
    }
    return false;
}

double ValueScriptStack::ToNumber(int index) const {
    const auto* value = argAt(index);
    if (value == nullptr) {
        return 0.0;
    }
    if (const auto* number = std::get_if<double>(value)) {
        return *number;
    }
    if (const auto* text = std::get_if<std::string>(value)) {
        return ParseScriptNumber(*text).value_or(0.0);
    }
    return 0.0;
}

void ValueScriptStack::PushBoolean(bool value) {
    results_.emplace_back(value);
}

void ValueScriptStack::PushNil() {
    results_.emplace_back(std::monostate{});
}

void ValueScriptStack::RaiseError(std::string_view message) {
    raisedError_ = std::string(message);
}

std::string ValueScriptStack::Describe(const ScriptValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return "nil";
    }
    if (const auto* flag = std::get_if<bool>(&value)) {
        return *flag ? "true" : "false";
    }
    if (const auto* number = std::get_if<double>(&value)) {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%.14g", *number);
        return buffer;
    }
    return std::get<std::string>(value);
}

}  // namespace interact::script
