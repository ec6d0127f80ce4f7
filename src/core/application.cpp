/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/application.hpp"
#include "core/logger.hpp"
#include "core/parameters.hpp"
#include "loader/loader.hpp"
#include "scene/scene_store.hpp"
#include "transport/scene_serializer.hpp"
#include <print>

namespace sc {

    namespace {
        void print_summaries(const scene::SceneStore& store) {
            for (const auto& name : store.names()) {
                auto info = store.summary(name);
                if (!info) {
                    LOG_WARN("No summary for '{}': {}", name, info.error().format());
                    continue;
                }
                std::println("{}: {} Gaussians, lod {:.3f} ({} displayed), point size {:.1f}, render {}, source {}",
                             info->name, info->count, info->lod, info->displayed, info->point_size,
                             info->enable_render ? "on" : "off",
                             info->source_path.empty() ? "<memory>" : info->source_path.string());
            }
        }

        bool write_preview(const scene::SceneStore& store, const std::filesystem::path& path) {
            nlohmann::json payload;
            payload["objects"] = nlohmann::json::array();

            for (const auto& name : store.names()) {
                auto object = store.getObject(name);
                auto points = store.preview(name);
                if (!object || !points) {
                    LOG_ERROR("Preview of '{}' failed", name);
                    return false;
                }
                if (!object->enable_render) {
                    continue;
                }
                payload["objects"].push_back(transport::serialize_preview(
                    name, *points, object->data->size(), object->lod, object->point_size));
            }

            auto written = transport::write_payload(payload, path);
            if (!written) {
                LOG_ERROR("{}", written.error());
                return false;
            }
            return true;
        }

        bool write_scene(const scene::SceneStore& store,
                         const param::TransportParameters& transport_params,
                         const std::filesystem::path& path) {
            const auto options = transport::TransportOptions::from_parameters(transport_params);
            const auto payload = transport::serialize_scene(store.transportObjects(), options);

            auto written = transport::write_payload(payload, path);
            if (!written) {
                LOG_ERROR("{}", written.error());
                return false;
            }
            return true;
        }
    } // namespace

    int Application::run(std::unique_ptr<param::RunParameters> params) {
        std::shared_ptr<loader::Loader> loader = loader::Loader::create();
        scene::SceneStore store(scene::make_loader_decoder(loader), params->config.preview);

        const auto imported = store.importFiles(params->inputs);
        if (imported.empty()) {
            LOG_ERROR("No input could be imported");
            return -1;
        }

        for (const auto& name : imported) {
            if (params->lod) {
                if (auto result = store.setLod(name, *params->lod); !result) {
                    LOG_ERROR("{}", result.error().format());
                    return -1;
                }
            }
            if (params->point_size) {
                if (auto result = store.setPointSize(name, *params->point_size); !result) {
                    LOG_ERROR("{}", result.error().format());
                    return -1;
                }
            }
        }

        if (params->print_info) {
            print_summaries(store);
        }

        if (!params->preview_path.empty() && !write_preview(store, params->preview_path)) {
            return -1;
        }

        if (!params->export_path.empty() &&
            !write_scene(store, params->config.transport, params->export_path)) {
            return -1;
        }

        if (imported.size() < params->inputs.size()) {
            LOG_WARN("{} of {} inputs failed to import", params->inputs.size() - imported.size(),
                     params->inputs.size());
        }
        return 0;
    }

} // namespace sc
