#include "../include/form_codec.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace demo {

struct feedback {
    std::string email;
    int rating = 0;
    std::vector<std::string> topics;
};

} // namespace demo

FORM_CODEC_RECORD(demo::feedback,
    FORM_CODEC_FIELD(email),
    FORM_CODEC_FIELD(rating),
    FORM_CODEC_FIELD(topics)
)

int main() {
    using namespace co::form;

    // Typed value as multipart/form-data
    multipart_conversion<demo::feedback> conversion;
    demo::feedback fb{"jane@example.com", 5, {"docs", "speed"}};

    auto body = conversion.unapply(fb);
    if (!body) {
        std::cout << "Framing failed: " << describe(body.error()) << "\n";
        return 1;
    }
    std::cout << "Content-Type: " << conversion.content_type() << "\n\n" << *body << "\n";

    auto back = conversion.apply(*body, conversion.content_type());
    if (back) {
        std::cout << "Decoded rating " << back->rating << " with "
                  << back->topics.size() << " topics\n";
    }

    // Validated file upload
    auto upload = file_upload::image(file_types::png(), "avatar", "me.png", 1024);
    std::string png = std::string("\x89PNG\r\n\x1A\n", 8) + "IHDR";

    auto framed = upload.unapply(png);
    if (framed) {
        auto payload = upload.apply(*framed, upload.content_type());
        std::cout << "Uploaded " << (payload ? payload->size() : 0) << " bytes\n";
    }

    auto rejected = upload.unapply("GIF89a....");
    if (!rejected) {
        std::cout << "Rejected: " << describe(rejected.error()) << "\n";
    }

    // Hand-assembled body
    multipart::form_builder builder;
    auto built = builder
        .field("comment", "see attached")
        .upload(upload_rule{file_types::csv()}, "sheet", "data.csv", "name,age\nAnn,30\n")
        .build();
    if (built) {
        auto parts = multipart::parse(*built, builder.boundary());
        if (parts) {
            for (const auto& part : *parts) {
                std::cout << part.name << (part.is_file() ? " (file)" : "") << ": "
                          << part.payload.size() << " bytes\n";
            }
        }
    }

    return 0;
}
