#include <charconv>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

#include <tsnorm.hpp>

using namespace tsnorm;

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " --list\n"
              << "  " << program << " <class_name> \"YYYY-MM-DD[ hh:mm:ss[.ffffff][+-hh:mm]]\"\n"
              << "  " << program << " <class_name> <field>=<integer> [<field>=<integer> ...]\n"
              << "  " << program << " --json '<serialized value>'\n";
}

// Parse "name=integer" into a field; negative values are signed, the rest unsigned
bool parseField(std::string_view arg, Field& field) {
    auto eq = arg.find('=');
    if (eq == std::string_view::npos || eq == 0) {
        return false;
    }
    std::string_view text = arg.substr(eq + 1);
    const char* first = text.data();
    const char* last = text.data() + text.size();

    field.name = std::string(arg.substr(0, eq));
    if (!text.empty() && text.front() == '-') {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr != last) {
            return false;
        }
        field.value = value;
    } else {
        uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr != last) {
            return false;
        }
        field.value = value;
    }
    return true;
}

void printValue(const DateTimeValues& value) {
    std::cout << "Class:      " << value.class_name() << "\n";
    std::cout << "Precision:  " << precision_string(value.precision()) << "\n";
    std::cout << "String:     " << value.copy_to_date_time_string().value_or("Not set") << "\n";
    std::cout << "ISO 8601:   " << value.copy_to_date_time_string_iso8601().value_or("Not set")
              << "\n";

    auto normalized = value.normalized_timestamp();
    std::cout << "Normalized: " << (normalized ? normalized->to_string() : "Not set") << "\n";

    auto posix = value.copy_to_posix_timestamp();
    if (posix) {
        std::cout << "POSIX:      " << *posix << "\n";
    }
    std::cout << "JSON:       " << Serializer::serialize(value).dump() << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string_view command = argv[1];

    if (command == "--list") {
        for (const auto& name : Factory::instance().class_names()) {
            std::cout << name << "\n";
        }
        return 0;
    }

    if (command == "--json") {
        if (argc != 3) {
            printUsage(argv[0]);
            return 1;
        }
        auto j = nlohmann::json::parse(argv[2], nullptr, false);
        if (j.is_discarded()) {
            std::cerr << "Error: input is not valid JSON\n";
            return 1;
        }
        auto value = Serializer::deserialize(j);
        if (!value) {
            std::cerr << "Error: " << value.error().message() << "\n";
            return 1;
        }
        printValue(**value);
        return 0;
    }

    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    auto value = Factory::instance().create(command);
    if (!value) {
        std::cerr << "Error: " << value.error().message() << ": " << command << "\n";
        return 1;
    }

    std::string_view first = argv[2];
    if (first.find('=') == std::string_view::npos) {
        if (argc != 3) {
            printUsage(argv[0]);
            return 1;
        }
        auto result = (*value)->copy_from_date_time_string(first);
        if (!result) {
            std::cerr << "Error: " << result.error().message() << ": " << first << "\n";
            return 1;
        }
    } else {
        FieldList fields;
        for (int i = 2; i < argc; ++i) {
            Field field;
            if (!parseField(argv[i], field)) {
                std::cerr << "Error: expected <field>=<integer>, got " << argv[i] << "\n";
                return 1;
            }
            fields.push_back(std::move(field));
        }
        auto result = (*value)->copy_from_fields(fields);
        if (!result) {
            std::cerr << "Error: " << result.error().message() << "\n";
            return 1;
        }
    }

    printValue(**value);
    return 0;
}
