#ifndef KEY_FILE_HPP
#define KEY_FILE_HPP

#include <string>
#include <utility>
#include <vector>

// Minimal INI style "[Section]" / "key=value" file. Lines that are neither
// (comments, blanks) are kept in place so a rewritten file keeps them.
class KeyFile {
public:
    // Returns false and fills error when the file cannot be read. A missing
    // file sets not_found so callers can treat it as an empty file.
    bool load_from_file(const std::string& path, std::string& error, bool* not_found = nullptr);
    bool load_from_string(const std::string& text);
    bool save_to_file(const std::string& path, std::string& error) const;
    std::string to_string() const;

    bool get_string(const std::string& section, const std::string& key, std::string& value) const;
    void set_value(const std::string& section, const std::string& key, const std::string& value);
    void delete_key(const std::string& section, const std::string& key);

private:
    struct Line {
        std::string key;   // empty for raw lines
        std::string value; // raw text when key is empty
    };
    struct Section {
        std::string name;
        std::vector<Line> lines;
    };

    Section* find_section(const std::string& name);
    const Section* find_section(const std::string& name) const;

    std::vector<Section> sections_;
};

#endif // KEY_FILE_HPP
