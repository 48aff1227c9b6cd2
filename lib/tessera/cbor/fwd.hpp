/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_FWD_HPP
#define TESSERA_CBOR_FWD_HPP

namespace tessera::cbor {
    struct decoder;
    template<typename W> struct encoder;
    template<typename T> struct codec;
    struct unit;
}

#endif // !TESSERA_CBOR_FWD_HPP
