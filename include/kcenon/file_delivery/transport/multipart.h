/**
 * @file multipart.h
 * @brief multipart/form-data body builder
 */

#ifndef KCENON_FILE_DELIVERY_TRANSPORT_MULTIPART_H
#define KCENON_FILE_DELIVERY_TRANSPORT_MULTIPART_H

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace kcenon::file_delivery {

/**
 * @brief Builds a multipart/form-data request body
 *
 * @code
 * multipart_builder form;
 * form.add_field("chunkIndex", "0");
 * form.add_file("chunk", "report.bin", bytes);
 * auto headers = base_headers;
 * headers["Content-Type"] = form.content_type();
 * client->post(url, form.build(), headers);
 * @endcode
 */
class multipart_builder {
public:
    multipart_builder();

    /**
     * @brief Use a fixed boundary (tests)
     */
    explicit multipart_builder(std::string boundary);

    auto add_field(const std::string& name, const std::string& value) -> multipart_builder&;

    auto add_file(const std::string& name,
                  const std::string& filename,
                  std::span<const uint8_t> content,
                  const std::string& content_type = "application/octet-stream")
        -> multipart_builder&;

    [[nodiscard]] auto content_type() const -> std::string;

    /**
     * @brief Finish the body with the closing boundary
     */
    [[nodiscard]] auto build() const -> std::vector<uint8_t>;

    [[nodiscard]] auto boundary() const -> const std::string& { return boundary_; }

private:
    void append(const std::string& text);

    std::string boundary_;
    std::vector<uint8_t> body_;
};

}  // namespace kcenon::file_delivery

#endif  // KCENON_FILE_DELIVERY_TRANSPORT_MULTIPART_H
