#include "UpdateTypes.hpp"

#include <type_traits>

namespace updater
{

std::string describe(const FetchError& error)
{
    return std::visit(
        [](const auto& e) -> std::string
        {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, NetworkError>)
            {
                std::string text = "Network error: " + e.message;
                if (e.statusCode != 0)
                {
                    text += " (status " + std::to_string(e.statusCode) + ")";
                }
                return text + " [" + e.url + "]";
            }
            else
            {
                static_assert(std::is_same_v<T, FormatError>);
                return "Invalid OTA response: " + e.message;
            }
        },
        error);
}

const char* toString(CompatibilityMode mode)
{
    switch (mode)
    {
    case CompatibilityMode::ExactMatch:
        return "exact match";
    case CompatibilityMode::BackwardCompatible:
        return "backward compatible";
    }
    return "unknown";
}

} // namespace updater
