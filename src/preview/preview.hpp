#ifndef INPAINT_PREVIEW_HPP
#define INPAINT_PREVIEW_HPP
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <torch/torch.h>

namespace Inpaint::Preview {
    namespace Detail {
        inline void require_image_batch(const torch::Tensor& images, const char* operation)
        {
            if (!images.defined() || images.dim() != 4) {
                throw std::invalid_argument(std::string(operation) + " expects an N x C x H x W tensor.");
            }
            if (images.size(0) == 0) {
                throw std::invalid_argument(std::string(operation) + " received an empty batch.");
            }
            const auto channels = images.size(1);
            if (channels != 1 && channels != 3) {
                throw std::invalid_argument(std::string(operation) + " supports 1 or 3 channel images (received "
                                            + std::to_string(channels) + ").");
            }
        }

        // tanh range [-1, 1] -> [0, 255], channels last.
        inline torch::Tensor to_uint8_hwc(const torch::Tensor& images)
        {
            return images.detach()
                .to(torch::kCPU, torch::kFloat32)
                .clamp(-1.0, 1.0)
                .add(1.0)
                .mul(127.5)
                .round()
                .to(torch::kUInt8)
                .permute({0, 2, 3, 1})
                .contiguous();
        }
    }

    // Tiles a batch row-major into one 8-bit BGR (or grayscale) image.
    [[nodiscard]] inline cv::Mat make_grid(const torch::Tensor& images, std::int64_t columns = 8, std::int64_t padding = 2)
    {
        Detail::require_image_batch(images, "make_grid");
        if (columns <= 0) {
            throw std::invalid_argument("make_grid requires a positive column count.");
        }
        if (padding < 0) {
            throw std::invalid_argument("make_grid requires a non-negative padding.");
        }

        const auto pixels = Detail::to_uint8_hwc(images);
        const auto count = pixels.size(0);
        const auto height = pixels.size(1);
        const auto width = pixels.size(2);
        const auto channels = pixels.size(3);
        const auto grid_columns = std::min(columns, count);
        const auto grid_rows = (count + grid_columns - 1) / grid_columns;

        auto canvas = torch::zeros({grid_rows * (height + padding) + padding,
                                    grid_columns * (width + padding) + padding,
                                    channels},
                                   torch::TensorOptions().dtype(torch::kUInt8));
        for (std::int64_t index = 0; index < count; ++index) {
            const auto top = padding + (index / grid_columns) * (height + padding);
            const auto left = padding + (index % grid_columns) * (width + padding);
            canvas.narrow(0, top, height).narrow(1, left, width).copy_(pixels[index]);
        }

        cv::Mat grid(static_cast<int>(canvas.size(0)),
                     static_cast<int>(canvas.size(1)),
                     CV_8UC(static_cast<int>(channels)),
                     canvas.data_ptr<std::uint8_t>());
        cv::Mat result = grid.clone();
        if (channels == 3) {
            cv::cvtColor(result, result, cv::COLOR_RGB2BGR);
        }
        return result;
    }

    inline void write_grid(const std::filesystem::path& path, const torch::Tensor& images, std::int64_t columns = 8)
    {
        if (path.empty()) {
            throw std::invalid_argument("write_grid requires a non-empty file path.");
        }
        const auto grid = make_grid(images, columns);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        if (!cv::imwrite(path.string(), grid)) {
            throw std::runtime_error("Failed to write image grid to '" + path.string() + "'.");
        }
    }

    // Pastes each generated patch into the centre of its context image.
    [[nodiscard]] inline torch::Tensor compose_inpainting(const torch::Tensor& context, const torch::Tensor& patch)
    {
        Detail::require_image_batch(context, "compose_inpainting");
        Detail::require_image_batch(patch, "compose_inpainting");
        if (context.size(0) != patch.size(0) || context.size(1) != patch.size(1)) {
            throw std::invalid_argument("compose_inpainting requires matching batch and channel dimensions.");
        }
        const auto height = patch.size(2);
        const auto width = patch.size(3);
        if (height > context.size(2) || width > context.size(3)) {
            throw std::invalid_argument("compose_inpainting patch is larger than its context image.");
        }

        const auto top = (context.size(2) - height) / 2;
        const auto left = (context.size(3) - width) / 2;
        auto composite = context.detach().clone();
        composite.narrow(2, top, height).narrow(3, left, width).copy_(patch.detach().to(composite.options()));
        return composite;
    }
}

#endif // INPAINT_PREVIEW_HPP
