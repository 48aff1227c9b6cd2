/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CONFIG_HPP
#define TESSERA_CONFIG_HPP

/*
 * Build-time capabilities. The build system passes each one as a compile definition;
 * a translation unit compiled without them gets the full host profile.
 *
 * TESSERA_ALLOC  - heap-backed containers and codecs, the work-list skip
 * TESSERA_STD    - host I/O: the frame layer, ostream_writer, boxed custom errors
 * TESSERA_HALF   - half-precision floats
 * TESSERA_LEGACY - network addresses use the older octet-array encoding
 */

#ifndef TESSERA_ALLOC
#   define TESSERA_ALLOC 1
#endif
#ifndef TESSERA_STD
#   define TESSERA_STD 1
#endif
#ifndef TESSERA_HALF
#   define TESSERA_HALF 1
#endif
#ifndef TESSERA_LEGACY
#   define TESSERA_LEGACY 0
#endif

#if TESSERA_STD && !TESSERA_ALLOC
#   error "TESSERA_STD requires TESSERA_ALLOC"
#endif

namespace tessera {
    struct capabilities {
        static constexpr bool alloc = TESSERA_ALLOC != 0;
        static constexpr bool host_io = TESSERA_STD != 0;
        static constexpr bool half = TESSERA_HALF != 0;
        static constexpr bool legacy = TESSERA_LEGACY != 0;
    };
}

#endif // !TESSERA_CONFIG_HPP
