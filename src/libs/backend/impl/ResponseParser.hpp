/*
 * Copyright (C) 2025 TRS contributors
 *
 * This file is part of TRS.
 *
 * TRS is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * TRS is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with TRS.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <string_view>
#include <vector>

#include "backend/Types.hpp"

namespace trs::backend::responseParser
{
    // Items without backend supplied features are left with an empty feature vector
    // throw UpstreamUnavailableException if the body cannot be parsed
    InteractionHistory parseLearnerProfile(const LearnerId& learnerId, std::string_view msgBody);
    Catalog parseTestCandidates(std::string_view msgBody);
    Catalog parseLectureCandidates(std::string_view msgBody);
    // Entries without a 'userId' are skipped
    std::vector<InteractionHistory> parsePeerProfiles(std::string_view msgBody);
} // namespace trs::backend::responseParser
