#include "rpc/framing.hpp"
#include "rpc/protocol.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace codebox::rpc {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

std::optional<size_t> parse_length(const std::string& value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(),
            [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        unsigned long long n = std::stoull(value);
        if (n > MAX_BODY_SIZE) {
            spdlog::error("Frame of {} bytes exceeds limit of {}", n, MAX_BODY_SIZE);
            return std::nullopt;
        }
        return static_cast<size_t>(n);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace

std::optional<size_t> read_header(std::istream& in) {
    std::optional<size_t> length;
    bool saw_length = false;
    bool saw_line = false;
    std::string line;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            if (!saw_line) {
                continue;  // Stray separator between frames
            }
            if (!saw_length) {
                spdlog::warn("Frame header without Content-Length");
            }
            return length;
        }
        saw_line = true;

        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            spdlog::debug("Ignoring malformed header line: {}", line);
            continue;
        }
        if (to_lower(trim(line.substr(0, colon))) == "content-length") {
            saw_length = true;
            length = parse_length(trim(line.substr(colon + 1)));
            if (!length) {
                spdlog::warn("Unparsable Content-Length: {}", line);
            }
        }
    }

    return std::nullopt;  // EOF
}

std::optional<std::string> read_body(std::istream& in, size_t length) {
    std::string body(length, '\0');
    if (length > 0) {
        in.read(&body[0], static_cast<std::streamsize>(length));
        if (static_cast<size_t>(in.gcount()) != length) {
            spdlog::warn("Short frame body: expected {} bytes, got {}", length, in.gcount());
            return std::nullopt;
        }
    }
    return body;
}

std::optional<std::string> read_frame(std::istream& in) {
    auto length = read_header(in);
    if (!length) {
        return std::nullopt;
    }
    return read_body(in, *length);
}

bool write_frame(std::ostream& out, const std::string& body) {
    out << "Content-Length: " << body.size() << "\r\n\r\n" << body;
    out.flush();
    return static_cast<bool>(out);
}

} // namespace codebox::rpc
