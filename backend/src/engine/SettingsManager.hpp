#pragma once

#include "engine/Settings.hpp"

#include <libtorrent/settings_pack.hpp>

namespace ft::engine
{

class SettingsManager
{
  public:
    // Seedbox-grade session settings derived from EngineSettings.
    static libtorrent::settings_pack
    build_settings_pack(EngineSettings const &s);

    static void apply_network(EngineSettings const &s,
                              libtorrent::settings_pack &pack);

    static void apply_throughput(EngineSettings const &s,
                                 libtorrent::settings_pack &pack);

    static int effective_upload_limit(EngineSettings const &s) noexcept;
};

} // namespace ft::engine
