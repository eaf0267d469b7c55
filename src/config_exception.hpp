#ifndef CONFIG_EXCEPTION_INCLUDE_GUARD
#define CONFIG_EXCEPTION_INCLUDE_GUARD

#include <exception>
#include <string>

namespace sentseg {

class config_exception: public std::exception {
public:
    config_exception(std::string const &message) : m_message(message) {}

    virtual ~config_exception() throw() {}

    virtual const char* what() const throw() {
        return m_message.c_str();
    }
private:
    std::string m_message;
};

}

#endif
