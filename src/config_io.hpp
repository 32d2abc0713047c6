#ifndef CONFIG_IO_HPP
#define CONFIG_IO_HPP

#include <optional>
#include <string>
#include <vector>

class ConfigIO {
public:
    // Replaces the file as a whole: the lines go to a uniquely named sibling file which is then
    // renamed over filePath. Parent directories are created as needed.
    static bool writeDocument(const std::string& filePath, const std::vector<std::string>& lines,
                              std::string& error);

    // Looks up a nested block-style key such as "remote:url".
    static std::optional<std::string> readOption(const std::string& filePath, const std::string& optionPath);

    static std::string quote(const std::string& value);
    static std::string unquote(const std::string& value);

private:
    static size_t getIndent(const std::string& line);
};

#endif // CONFIG_IO_HPP
