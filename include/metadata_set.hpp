//
//  metadata_set.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/17/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

namespace narrateforge {

/**
 * @brief Book-level tags carried into the chapter sidecar files.
 *
 * Fields are UTF-8; empty fields are omitted from FFMETADATA output.
 */
struct MetadataSet {
    std::string title;    ///< Book title
    std::string artist;   ///< Author/narrator
    std::string album;    ///< Series/collection
    std::string genre;    ///< Genre tag
    std::string year;     ///< Year (free-form)
    std::string comment;  ///< Comment/description
};

}  // namespace narrateforge
