// main.cpp - meetcap entry point
//
// Console meeting recorder: system audio and microphone, mixed into one WAV.

#include "core/Application.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    try {
        mc::Application app(argc, argv);

        auto opts = app.parseArgs();
        if (!opts) {
            std::cerr << "meetcap: " << opts.error().message << "\n"
                      << "Try 'meetcap --help' for usage information.\n";
            return 2;
        }

        if (auto res = app.init(*opts); !res) {
            std::cerr << "meetcap: " << res.error().message << "\n";
            return 1;
        }

        return app.exec();

    } catch (const std::exception& e) {
        std::cerr << "meetcap: fatal: " << e.what() << "\n";
        return 1;
    }
}
