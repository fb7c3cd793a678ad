#include "common/exceptions.hpp"

namespace passk {
using namespace std;

passk_exception::passk_exception(const string &what) : message(what) {}

const char *passk_exception::what() const noexcept {
    return message.c_str();
}

void passk_exception::append(const string &text) {
    message += text;
}

}  // namespace passk
