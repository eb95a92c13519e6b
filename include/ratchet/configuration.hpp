#pragma once

#include <ratchet/common.hpp>
#include <ratchet/generator.hpp>

#include <span>
#include <string>
#include <string_view>

namespace ratchet {

/*
 * Read-only view of git-style INI configuration.
 *
 * The project file lives under the nearest .ratchet directory above the
 * working directory; the per-user file of the same name under
 * $XDG_CONFIG_HOME/ratchet (or ~/.config/ratchet) supplies defaults for
 * whatever the project file leaves unset.
 *
 * Locators name `{"section", "key"}`, or `{"section", "subsection", "key"}`
 * for a `[section "subsection"]` block.
 */
class Configuration {
public:
    /*
     * Create the project configuration directory if none is found.
     *
     * Returns true if a new directory was created.
     */
    static bool init();

    /*
     * Constructor
     */
    Configuration(std::span<std::string_view const> subpath, bool user_wide = false);

    Configuration(Configuration const &) = delete;
    Configuration & operator=(Configuration const &) = delete;

    /*
     * Value at the locator, or empty if no file sets it.
     */
    std::string_view operator[](std::span<std::string_view const> locator) const;

    /*
     * Generator over sections (subcategories). With a one-element locator,
     * yields the subsection names of that section.
     * The generator must not outlive the configuration.
     */
    Generator<std::string()> sections(std::span<std::string_view const> locator = {}) const;

    /*
     * Generator over key-value pairs.
     * The generator must not outlive the configuration.
     */
    Generator<StringPair()> values(std::span<std::string_view const> locator) const;

    /*
     * Destructor
     */
    ~Configuration();

    /*
     * Get a per-project configuration path.
     */
    static std::string_view path_local(std::span<std::string_view const> subpath = {}, bool is_dir = false);

    /*
     * Get a per-user configuration path.
     */
    static std::string_view path_user(std::span<std::string_view const> subpath = {}, bool is_dir = false);

private:
    void* impl_;
};

} // namespace ratchet
