#pragma once

#include <string>

namespace sigcheck::methods
{
    struct CheckerOptions
    {
        // A receiver-less, argument-less function with this name is a constructor.
        std::string constructorName{"__new__"};
        // First argument type required by pass_module free functions.
        std::string moduleTypeName{"PyModule"};
        // First argument type required by class methods.
        std::string typeObjectName{"PyType"};
        std::string getterPrefix{"get_"};
        std::string setterPrefix{"set_"};
    };
} // namespace sigcheck::methods
