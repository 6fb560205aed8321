/**
 * @file dualffi_probe.cpp
 * @brief Report the active engine and how it resolves type names.
 * 
 * Usage: dualffi_probe [--library PATH] [TYPE ...]
 * 
 * @copyright Copyright (c) 2025 URPKS Contributors
 * @license Apache-2.0 OR MIT
 */

#include "dualffi/api.h"

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

const std::vector<std::string> kDefaultTypes = {
    "int",
    "unsigned int",
    "size_t",
    "void *",
    "char *",
    "unsigned char *",
    "wchar_t *",
    "char **",
};

void print_type(const dualffi::Engine& engine, const dualffi::Library& library,
                const std::string& type_name) {
    try {
        const dualffi::NativeType type = engine.resolve(&library, type_name);
        std::cout << std::left << std::setw(20) << type_name
                  << " base=" << std::setw(16) << type.base.name
                  << " kind=" << std::setw(8) << dualffi::to_string(type.base.kind)
                  << " indirection=" << type.indirection
                  << (type.atomic_pointer ? " atomic" : "")
                  << " size=" << type.size() << "\n";
    } catch (const std::invalid_argument& e) {
        std::cout << std::left << std::setw(20) << type_name << " error: " << e.what() << "\n";
    }
}

}  // namespace

int main(int argc, char** argv) {
    std::string library_path;
    std::vector<std::string> types;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--library" && i + 1 < argc) {
            library_path = argv[++i];
        } else {
            types.push_back(arg);
        }
    }
    if (types.empty()) {
        types = kDefaultTypes;
    }

    try {
        const dualffi::Engine& engine = dualffi::active_engine();
        std::cout << "engine: " << engine.name() << "\n";

        std::unique_ptr<dualffi::Library> library;
        if (library_path.empty()) {
            library = std::make_unique<dualffi::Library>("builtins");
        } else {
            library = std::make_unique<dualffi::Library>(dualffi::Library::open(library_path));
            std::cout << "library: " << library->name() << "\n";
        }

        for (const auto& type_name : types) {
            print_type(engine, *library, type_name);
        }
    } catch (const dualffi::FFIEngineError& e) {
        std::cerr << "dualffi_probe: " << e.what() << "\n";
        return 2;
    } catch (const dualffi::LibraryNotFoundError& e) {
        std::cerr << "dualffi_probe: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
