#pragma once

#include "tsnorm/date_time_values.hpp"
#include "tsnorm/detail/parse_result.hpp"
#include "tsnorm/fat_date_time.hpp"
#include "tsnorm/formats.hpp"
#include "tsnorm/rfc2579_date_time.hpp"
#include "tsnorm/semantic_time.hpp"
#include "tsnorm/time_elements.hpp"
#include "tsnorm/types.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <cstddef>

namespace tsnorm {

/**
 * Registry of date and time formats by class name.
 *
 * The process-wide instance is populated with every built-in format on
 * first use and is read-only afterwards unless a caller registers more.
 *
 * Usage:
 * @code
 *   auto value = Factory::instance().create("FATDateTime");
 *   if (!value) {
 *       std::cerr << value.error().message() << "\n";
 *   }
 * @endcode
 */
class Factory {
public:
    using Constructor = std::function<std::unique_ptr<DateTimeValues>()>;

    /// Empty registry
    Factory() = default;

    /// Process-wide registry holding the built-in formats
    static Factory& instance() {
        static Factory factory = with_builtin_formats();
        return factory;
    }

    /**
     * Register a format.
     *
     * @return false when the name is already taken; the existing entry stays
     */
    bool register_format(std::string class_name, Constructor constructor) {
        if (!constructor) {
            return false;
        }
        return constructors_.emplace(std::move(class_name), std::move(constructor)).second;
    }

    /// Register a format type under its class_name_v
    template <typename T>
    bool register_format() {
        return register_format(std::string(T::class_name_v),
                               [] { return std::make_unique<T>(); });
    }

    /**
     * Create a default constructed value of the named format.
     *
     * @return Owning pointer, or ParseError(unknown_format)
     */
    ParseResult<std::unique_ptr<DateTimeValues>> create(std::string_view class_name) const {
        auto it = constructors_.find(class_name);
        if (it == constructors_.end()) {
            return make_parse_error(ParseErrorCode::unknown_format);
        }
        return it->second();
    }

    bool contains(std::string_view class_name) const {
        return constructors_.find(class_name) != constructors_.end();
    }

    /// Registered names in sorted order
    std::vector<std::string> class_names() const {
        std::vector<std::string> names;
        names.reserve(constructors_.size());
        for (const auto& [name, constructor] : constructors_) {
            names.push_back(name);
        }
        return names;
    }

    size_t size() const noexcept { return constructors_.size(); }

private:
    static Factory with_builtin_formats() {
        Factory factory;
        factory.register_format<APFSTime>();
        factory.register_format<DotNetDateTime>();
        factory.register_format<FATDateTime>();
        factory.register_format<Filetime>();
        factory.register_format<HFSTime>();
        factory.register_format<JavaTime>();
        factory.register_format<Never>();
        factory.register_format<PosixTime>();
        factory.register_format<PosixTimeInMicroseconds>();
        factory.register_format<PosixTimeInMilliseconds>();
        factory.register_format<PosixTimeInNanoseconds>();
        factory.register_format<RFC2579DateTime>();
        factory.register_format<TimeElements>();
        factory.register_format<TimeElementsInMicroseconds>();
        factory.register_format<TimeElementsInMilliseconds>();
        factory.register_format<UUIDTime>();
        factory.register_format<WebKitTime>();
        return factory;
    }

    std::map<std::string, Constructor, std::less<>> constructors_;
};

} // namespace tsnorm
