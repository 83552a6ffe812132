#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <sg/json.h>
#include <sg/validate.h>

static const char* kUsage =
        "usage:\n"
        "  schemaguard --validate <schema.json> <value.json>\n"
        "  schemaguard --defaults <schema.json> <value.json>\n";

static bool read_file(const std::string& path, std::string& content) {
    std::ifstream in(path);
    if (!in) return false;
    content.assign((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return true;
}

int main(int argc, char** argv) {
    if (argc != 4) {
        std::cerr << kUsage;
        return 2;
    }

    const std::string mode = argv[1];
    if (mode != "--validate" && mode != "--defaults") {
        std::cerr << "error: unknown mode '" << mode << "'\n" << kUsage;
        return 2;
    }

    const std::string schema_path = argv[2];
    const std::string data_path = argv[3];

    std::string schema_content;
    if (!read_file(schema_path, schema_content)) {
        std::cerr << "error: cannot open schema: " << schema_path << "\n";
        return 2;
    }
    std::string content;
    if (!read_file(data_path, content)) {
        std::cerr << "error: cannot open file: " << data_path << "\n";
        return 2;
    }

    sg::Dictionary schema;
    sg::Dictionary data;
    try {
        schema = sg::parse_json(schema_content);
    } catch (const sg::JsonParseError& e) {
        std::cerr << "schema " << e.what() << "\n";
        return 2;
    }
    try {
        data = sg::parse_json(content);
    } catch (const sg::JsonParseError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    if (mode == "--defaults") {
        std::cout << sg::getValidValueOrDefault(schema, data).dump(4) << std::endl;
        return 0;
    }

    auto err = sg::validate(data, schema);
    if (err.has_value()) {
        std::cerr << "validation error at " << err->path() << ": " << err->what() << "\n";
        return 1;
    }
    std::cout << "OK: validation passed\n";
    return 0;
}
