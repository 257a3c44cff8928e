#pragma once

#include <iostream>
#include <string>
#include <exception>

namespace rci {

    class RciError: public std::exception {
    public:
        inline RciError() {
            std::cout << "FATAL-ERROR: see above error messages." << std::endl;
        }
    public:
        char const* what() const noexcept override {
            return "rci::RciError";
        }
    };

    void error(std::string msg);
    void warning(std::string msg);
    void info(std::string msg);
    void more(std::string msg);

}   // namespace rci
