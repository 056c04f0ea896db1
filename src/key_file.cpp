#include "key_file.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <sstream>

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

bool KeyFile::load_from_file(const std::string& path, std::string& error, bool* not_found) {
    if (not_found) *not_found = false;
    std::ifstream in(path);
    if (!in) {
        int err = errno;
        if (not_found && err == ENOENT) *not_found = true;
        error = path + ": " + error_to_string(err);
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    if (!load_from_string(ss.str())) {
        error = path + ": malformed section header";
        return false;
    }
    return true;
}

bool KeyFile::load_from_string(const std::string& text) {
    std::vector<Section> parsed;
    parsed.push_back(Section{});

    std::istringstream in(text);
    std::string raw;
    while (std::getline(in, raw)) {
        std::string line = trim(raw);
        if (!line.empty() && line[0] == '[') {
            if (line.back() != ']') {
                return false;
            }
            parsed.push_back(Section{line.substr(1, line.size() - 2), {}});
            continue;
        }
        size_t eq = line.find('=');
        if (line.empty() || line[0] == '#' || line[0] == ';' || eq == std::string::npos) {
            parsed.back().lines.push_back(Line{"", raw});
            continue;
        }
        parsed.back().lines.push_back(Line{trim(line.substr(0, eq)), trim(line.substr(eq + 1))});
    }

    sections_ = std::move(parsed);
    return true;
}

std::string KeyFile::to_string() const {
    std::string out;
    for (const auto& section : sections_) {
        if (!section.name.empty()) {
            out += "[" + section.name + "]\n";
        }
        for (const auto& line : section.lines) {
            if (line.key.empty()) {
                out += line.value + "\n";
            } else {
                out += line.key + "=" + line.value + "\n";
            }
        }
    }
    return out;
}

bool KeyFile::save_to_file(const std::string& path, std::string& error) const {
    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            error = tmp + ": " + error_to_string(errno);
            return false;
        }
        out << to_string();
        out.flush();
        if (!out) {
            error = tmp + ": write failed";
            return false;
        }
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        error = path + ": " + error_to_string(errno);
        std::remove(tmp.c_str());
        return false;
    }
    return true;
}

bool KeyFile::get_string(const std::string& section, const std::string& key, std::string& value) const {
    const Section* s = find_section(section);
    if (!s) return false;
    for (const auto& line : s->lines) {
        if (line.key == key) {
            value = line.value;
            return true;
        }
    }
    return false;
}

void KeyFile::set_value(const std::string& section, const std::string& key, const std::string& value) {
    Section* s = find_section(section);
    if (!s) {
        sections_.push_back(Section{section, {}});
        s = &sections_.back();
    }
    for (auto& line : s->lines) {
        if (line.key == key) {
            line.value = value;
            return;
        }
    }
    s->lines.push_back(Line{key, value});
}

void KeyFile::delete_key(const std::string& section, const std::string& key) {
    Section* s = find_section(section);
    if (!s) return;
    s->lines.erase(std::remove_if(s->lines.begin(), s->lines.end(),
                                  [&](const Line& l) { return l.key == key; }),
                   s->lines.end());
}

KeyFile::Section* KeyFile::find_section(const std::string& name) {
    for (auto& s : sections_) {
        if (!s.name.empty() && s.name == name) return &s;
    }
    return nullptr;
}

const KeyFile::Section* KeyFile::find_section(const std::string& name) const {
    for (const auto& s : sections_) {
        if (!s.name.empty() && s.name == name) return &s;
    }
    return nullptr;
}
