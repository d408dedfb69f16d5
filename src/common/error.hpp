#ifndef FATHOM_COMMON_ERROR_HPP
#define FATHOM_COMMON_ERROR_HPP

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

namespace Fathom {
    // Invalid hyperparameters or option values, raised at construction time.
    class ConfigurationError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // Tensor rank, batch or feature size disagrees with the configured model.
    class ShapeMismatchError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // Training produced a non-finite objective.
    class NumericalInstabilityError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    namespace Common::Details {
        inline std::string describe_shape(const torch::Tensor& tensor)
        {
            if (!tensor.defined()) {
                return "<undefined>";
            }
            std::ostringstream stream;
            stream << '(';
            for (int64_t i = 0; i < tensor.dim(); ++i) {
                if (i > 0) {
                    stream << ", ";
                }
                stream << tensor.size(i);
            }
            stream << ')';
            return stream.str();
        }

        inline void expect_matrix(const torch::Tensor& tensor, int64_t features, const char* name)
        {
            if (!tensor.defined()) {
                throw ShapeMismatchError(std::string(name) + " tensor must be defined.");
            }
            if (tensor.dim() != 2) {
                throw ShapeMismatchError(std::string(name) + " must be a (batch, features) matrix, got "
                                         + describe_shape(tensor) + ".");
            }
            if (tensor.size(1) != features) {
                throw ShapeMismatchError(std::string(name) + " expects " + std::to_string(features)
                                         + " features, got " + describe_shape(tensor) + ".");
            }
        }

        inline void expect_same_batch(const torch::Tensor& lhs, const char* lhs_name,
                                      const torch::Tensor& rhs, const char* rhs_name,
                                      int64_t lhs_axis = 0)
        {
            if (lhs.size(lhs_axis) != rhs.size(0)) {
                throw ShapeMismatchError(std::string("Batch size of ") + lhs_name + " " + describe_shape(lhs)
                                         + " does not match " + rhs_name + " " + describe_shape(rhs) + ".");
            }
        }
    }
}

#endif // FATHOM_COMMON_ERROR_HPP
