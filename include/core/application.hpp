/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <memory>

namespace sc {

    namespace param {
        struct RunParameters;
    } // namespace param

    class Application {
    public:
        int run(std::unique_ptr<param::RunParameters> params);
    };

} // namespace sc
