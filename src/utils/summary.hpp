#ifndef INPAINT_SUMMARY_HPP
#define INPAINT_SUMMARY_HPP

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "../block/block.hpp"
#include "terminal.hpp"

namespace Inpaint::Utils::Summary {
    inline std::string format_shape(const std::vector<std::int64_t>& shape)
    {
        if (shape.empty()) {
            return std::string{"()"};
        }

        std::ostringstream stream;
        stream << '(';
        for (std::size_t i = 0; i < shape.size(); ++i) {
            if (i > 0) {
                stream << " x ";
            }
            stream << shape[i];
        }
        stream << ')';
        return stream.str();
    }

    // "torch::nn::ConvTranspose2dImpl" -> "ConvTranspose2d"
    inline std::string short_module_name(std::string_view name)
    {
        if (const auto position = name.rfind("::"); position != std::string_view::npos) {
            name.remove_prefix(position + 2);
        }
        constexpr std::string_view kImplSuffix{"Impl"};
        if (name.size() > kImplSuffix.size() && name.substr(name.size() - kImplSuffix.size()) == kImplSuffix) {
            name.remove_suffix(kImplSuffix.size());
        }
        return std::string{name};
    }

    inline void print(std::ostream& stream,
                      std::string_view title,
                      const std::vector<std::int64_t>& input_shape,
                      const std::vector<::Inpaint::Block::LayerTrace>& traces)
    {
        using namespace ::Inpaint::Utils::Terminal;
        const std::vector<std::size_t> spacings{5, 18, 11, 24, 12};

        std::int64_t total_parameters = 0;
        for (const auto& trace : traces) {
            total_parameters += trace.parameters;
        }

        stream << ApplyColor(title, Colors::kGoldenrod) << "  input " << format_shape(input_shape) << '\n';
        stream << HSeparator(spacings, Colors::kBrightBlack, HSepKind::Top) << '\n';
        stream << Row({" #", " Layer", " Act.", " Output", " Params"}, spacings, Colors::kBrightBlack) << '\n';
        stream << HSeparator(spacings, Colors::kBrightBlack, HSepKind::Middle) << '\n';
        for (std::size_t i = 0; i < traces.size(); ++i) {
            const auto& trace = traces[i];
            stream << Row({" " + std::to_string(i),
                           " " + short_module_name(trace.module),
                           " " + trace.activation,
                           " " + format_shape(trace.output_shape),
                           " " + std::to_string(trace.parameters)},
                          spacings, Colors::kBrightBlack) << '\n';
        }
        stream << HSeparator(spacings, Colors::kBrightBlack, HSepKind::Bottom) << '\n';
        stream << "Total parameters: " << total_parameters << '\n';
    }
}

#endif // INPAINT_SUMMARY_HPP
