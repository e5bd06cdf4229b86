#ifndef INICONFIG_HPP
#define INICONFIG_HPP

#include <iosfwd>
#include <map>
#include <string>

class IniConfig {
public:
    using Section = std::map<std::string, std::string>;

    bool load(const std::string& filename);
    void load_from_string(const std::string& content);

    std::string getValue(const std::string& section,
                         const std::string& key,
                         const std::string& default_value = "") const;
    bool hasValue(const std::string& section, const std::string& key) const;
    void setValue(const std::string& section, const std::string& key, const std::string& value);

    // Empty map when the section is absent
    Section getSection(const std::string& section) const;

private:
    void parse_stream(std::istream& stream);

    std::map<std::string, Section> data;
};

#endif // INICONFIG_HPP
