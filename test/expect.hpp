#ifndef INPAINT_TEST_EXPECT_HPP
#define INPAINT_TEST_EXPECT_HPP

#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../src/utils/terminal.hpp"

namespace Inpaint::Test {
    // Collects failed expectations; `report()` is the process exit code.
    class Expect {
    public:
        explicit Expect(std::string suite) : suite_(std::move(suite)) {}

        void that(bool condition, const std::string& message)
        {
            ++checks_;
            if (!condition) {
                ++failures_;
                Utils::Terminal::Failure(std::cerr, suite_ + ": " + message);
            }
        }

        void shape(const torch::Tensor& tensor, const std::vector<std::int64_t>& expected, const std::string& message)
        {
            that(tensor.defined() && tensor.sizes().vec() == expected,
                 message + " (got " + (tensor.defined() ? shape_string(tensor.sizes().vec()) : std::string{"undefined"})
                 + ", expected " + shape_string(expected) + ")");
        }

        // Only `Exception` itself counts; derived classes (invalid_argument for logic_error) fail.
        template <class Exception, class Callable>
        void throws(Callable&& callable, const std::string& message)
        {
            bool thrown = false;
            try {
                callable();
            } catch (const Exception& error) {
                if (typeid(error) != typeid(Exception)) {
                    that(false, message + " (threw derived " + typeid(error).name() + ": " + error.what() + ")");
                    return;
                }
                thrown = true;
            } catch (const std::exception& error) {
                that(false, message + " (threw unexpected: " + error.what() + ")");
                return;
            }
            that(thrown, message + " (nothing thrown)");
        }

        // Any class derived from `Exception` counts; for libtorch's c10::Error family.
        template <class Exception, class Callable>
        void throws_kind(Callable&& callable, const std::string& message)
        {
            bool thrown = false;
            try {
                callable();
            } catch (const Exception&) {
                thrown = true;
            } catch (const std::exception& error) {
                that(false, message + " (threw unexpected: " + error.what() + ")");
                return;
            }
            that(thrown, message + " (nothing thrown)");
        }

        [[nodiscard]] int report() const
        {
            if (failures_ > 0) {
                std::cerr << suite_ << ": " << failures_ << " of " << checks_ << " checks failed." << std::endl;
                return 1;
            }
            Utils::Terminal::Success(std::cout, suite_ + ": " + std::to_string(checks_) + " checks passed.");
            return 0;
        }

    private:
        static std::string shape_string(const std::vector<std::int64_t>& shape)
        {
            std::string text = "(";
            for (std::size_t i = 0; i < shape.size(); ++i) {
                text += (i ? ", " : "") + std::to_string(shape[i]);
            }
            return text + ")";
        }

        std::string suite_;
        int checks_{0};
        int failures_{0};
    };
}

#endif // INPAINT_TEST_EXPECT_HPP
