#ifndef CORE_CONFIG_FILE_HPP
#define CORE_CONFIG_FILE_HPP

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hftypes.hpp"


namespace hf {

/* INI-style settings: "[section]" headers, "key = value" lines, '#'
 * comments, optionally quoted values, and $VAR or ${VAR} environment
 * expansion. Keys outside a section belong to the "general" section.
 */
class ConfigFile {
    struct ConfigEntry {
        std::string key;
        std::string value;
    };
    std::vector<ConfigEntry> mEntries;
    std::string mSource;

    [[nodiscard]] auto findValue(std::string_view section, std::string_view key) const
        -> const std::string*;

public:
    /* Throws config_error if the file can't be opened. */
    [[nodiscard]] static auto Load(const std::filesystem::path &fname) -> ConfigFile;
    [[nodiscard]] static auto Parse(std::istream &f, std::string source) -> ConfigFile;

    [[nodiscard]] auto source() const noexcept -> const std::string& { return mSource; }
    [[nodiscard]] auto size() const noexcept -> usize { return mEntries.size(); }

    /* Sets a "section/key" entry, or removes it for an empty value. */
    void set(std::string key, std::string value);

    /* Accessors return nullopt for an absent key and throw config_error for
     * a value of the wrong type.
     */
    [[nodiscard]] auto valueStr(std::string_view section, std::string_view key) const
        -> std::optional<std::string>;
    [[nodiscard]] auto valueU32(std::string_view section, std::string_view key) const
        -> std::optional<u32>;
    [[nodiscard]] auto valueF64(std::string_view section, std::string_view key) const
        -> std::optional<f64>;
    [[nodiscard]] auto valueBool(std::string_view section, std::string_view key) const
        -> std::optional<bool>;
    [[nodiscard]] auto valueU32List(std::string_view section, std::string_view key) const
        -> std::optional<std::vector<u32>>;
};

} // namespace hf

#endif /* CORE_CONFIG_FILE_HPP */
