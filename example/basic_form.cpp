#include "../include/form_codec.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace demo {

struct address {
    std::string street;
    std::string city;
};

struct registration {
    std::string name;
    int age = 0;
    std::vector<std::string> interests;
    std::optional<std::string> referrer;
    address home;
};

} // namespace demo

FORM_CODEC_RECORD(demo::address,
    FORM_CODEC_FIELD(street),
    FORM_CODEC_FIELD(city)
)

FORM_CODEC_RECORD(demo::registration,
    FORM_CODEC_FIELD(name),
    FORM_CODEC_FIELD(age),
    FORM_CODEC_FIELD(interests),
    FORM_CODEC_FIELD(referrer, "ref"),
    FORM_CODEC_FIELD(home)
)

int main() {
    using namespace co::form;

    demo::registration reg;
    reg.name = "Jane Doe";
    reg.age = 28;
    reg.interests = {"chess", "hiking"};
    reg.home = {"1 Main St", "Springfield"};

    for (auto nesting : {nesting_strategy::brackets, nesting_strategy::indexed_brackets}) {
        auto config = codec_config{}.with_nesting(nesting);

        auto wire = encode(reg, config);
        if (!wire) {
            std::cout << "Encode failed: " << describe(wire.error()) << "\n";
            return 1;
        }
        std::cout << to_string(nesting) << ": " << *wire << "\n";

        auto back = decode<demo::registration>(*wire, config);
        if (!back) {
            std::cout << "Decode failed: " << describe(back.error()) << "\n";
            return 1;
        }
        std::cout << "  name=" << back->name << " city=" << back->home.city
                  << " interests=" << back->interests.size() << "\n";
    }

    // Flat bodies use repeated keys
    auto tree = urlencoded::parse("tags=a&tags=b&q=foo%2Bbar+baz");
    if (tree) {
        std::cout << "q decodes to: " << tree->find("q")->scalar() << "\n";
        std::cout << "tags count: " << tree->find("tags")->size() << "\n";
    }

    // Errors name the offending field
    auto missing = decode<demo::registration>("name=x", codec_config{}.with_nesting(nesting_strategy::brackets));
    if (!missing) {
        std::cout << "Expected failure: " << describe(missing.error()) << "\n";
    }

    return 0;
}
