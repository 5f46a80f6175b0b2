/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: hullview_lib.cpp
    МОДУЛЬ: hullview-lib
    ЗОРИЛГО: Compiled library target anchor translation unit.
*/

#include "hv/frame/frame_runner.hpp"
#include "hv/app/config_overrides.hpp"
#include "hv/resources/loaders/mesh_loader_assimp.hpp"

namespace hv
{
    int hullview_compiled_target_anchor()
    {
        return 0;
    }
}
