#pragma once

#include <string>
#include <vector>
#include <string_view>
#include <utility>


namespace lcr {
namespace observability {

// Escapes a label value per the text exposition format: \ -> \\, " -> \", LF -> \n
inline void append_escaped_label_value(std::string& out, std::string_view value) {
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            default:   out.push_back(c); break;
        }
    }
}

// Escapes HELP text: \ -> \\, LF -> \n (quotes are left alone)
inline std::string escape_help(std::string_view help) {
    std::string out;
    out.reserve(help.size());
    for (char c : help) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            default:   out.push_back(c); break;
        }
    }
    return out;
}


// ---------------------------------------------------------------------------
// label_stack
// ---------------------------------------------------------------------------
// Ordered label set rendered as {k1="v1",k2="v2"}. Labels are pushed and
// popped around groups of samples; the rendered form is cached and rebuilt
// only when the stack changes.
// ---------------------------------------------------------------------------
class label_stack {
public:
    inline void push(std::string_view key, std::string_view value) {
        labels_.emplace_back(std::string(key), std::string(value));
        rebuild_();
    }

    inline void pop() {
        if (labels_.empty())
            return;
        labels_.pop_back();
        rebuild_();
    }

    inline void clear() noexcept {
        labels_.clear();
        rendered_.clear();
    }

    [[nodiscard]]
    inline bool empty() const noexcept {
        return labels_.empty();
    }

    // "" when empty, otherwise {k="v",...}
    [[nodiscard]]
    inline const std::string& str() const noexcept {
        return rendered_;
    }

    // Current labels plus one trailing label, e.g. the histogram "le" label
    [[nodiscard]]
    inline std::string str_with(std::string_view key, std::string_view value) const {
        std::string out;
        out.reserve(rendered_.size() + key.size() + value.size() + 8);
        out.push_back('{');
        append_body_(out);
        if (!labels_.empty()) out.push_back(',');
        out.append(key);
        out += "=\"";
        append_escaped_label_value(out, value);
        out += "\"}";
        return out;
    }

private:
    inline void append_body_(std::string& out) const {
        bool first = true;
        for (const auto& [k, v] : labels_) {
            if (!first) out.push_back(',');
            first = false;
            out += k;
            out += "=\"";
            append_escaped_label_value(out, v);
            out.push_back('"');
        }
    }

    inline void rebuild_() {
        rendered_.clear();
        if (labels_.empty()) return;
        rendered_.push_back('{');
        append_body_(rendered_);
        rendered_.push_back('}');
    }

    std::vector<std::pair<std::string, std::string>> labels_;
    std::string rendered_;
};

} // namespace observability
} // namespace lcr
