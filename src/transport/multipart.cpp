/**
 * @file multipart.cpp
 * @brief multipart/form-data body builder implementation
 */

#include <kcenon/file_delivery/transport/multipart.h>

#include <random>

namespace kcenon::file_delivery {

namespace {

auto random_boundary() -> std::string {
    static constexpr char alphabet[] =
        "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<std::size_t> dis(0, sizeof(alphabet) - 2);

    std::string boundary = "----FileDeliveryBoundary";
    for (int i = 0; i < 24; ++i) {
        boundary += alphabet[dis(gen)];
    }
    return boundary;
}

auto quote_filename(const std::string& name) -> std::string {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        if (c == '\r' || c == '\n') {
            continue;
        }
        out += c;
    }
    return out;
}

}  // namespace

multipart_builder::multipart_builder() : boundary_(random_boundary()) {}

multipart_builder::multipart_builder(std::string boundary) : boundary_(std::move(boundary)) {}

void multipart_builder::append(const std::string& text) {
    body_.insert(body_.end(), text.begin(), text.end());
}

auto multipart_builder::add_field(const std::string& name, const std::string& value)
    -> multipart_builder& {
    append("--" + boundary_ + "\r\n");
    append("Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n");
    append(value);
    append("\r\n");
    return *this;
}

auto multipart_builder::add_file(const std::string& name,
                                 const std::string& filename,
                                 std::span<const uint8_t> content,
                                 const std::string& content_type) -> multipart_builder& {
    append("--" + boundary_ + "\r\n");
    append("Content-Disposition: form-data; name=\"" + name + "\"; filename=\"" +
           quote_filename(filename) + "\"\r\n");
    append("Content-Type: " + content_type + "\r\n\r\n");
    body_.insert(body_.end(), content.begin(), content.end());
    append("\r\n");
    return *this;
}

auto multipart_builder::content_type() const -> std::string {
    return "multipart/form-data; boundary=" + boundary_;
}

auto multipart_builder::build() const -> std::vector<uint8_t> {
    auto body = body_;
    std::string closing = "--" + boundary_ + "--\r\n";
    body.insert(body.end(), closing.begin(), closing.end());
    return body;
}

}  // namespace kcenon::file_delivery
