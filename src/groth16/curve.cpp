// Copyright (c) 2023 The Bitcoin developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <groth16/curve.h>

#include <logging.h>

#include <mutex>

bool InitGroth16Curve()
{
    static std::once_flag init_flag;
    static bool initialized{false};

    std::call_once(init_flag, [] {
        int ret = mclBn_init(MCL_BLS12_381, MCLBN_COMPILED_TIME_VAR);
        if (ret != 0) {
            LogPrintf("Groth16: mclBn_init(MCL_BLS12_381) failed with error %d\n", ret);
            return;
        }
        initialized = true;
    });

    return initialized;
}
