#ifndef OPTION_HPP
#define OPTION_HPP

enum class Option_Type { Call, Put };

struct Option_Spec {
    Option_Type type;
    double spot;
    double strike;
    double time_to_expiry;
    bool is_american;
};

#endif
