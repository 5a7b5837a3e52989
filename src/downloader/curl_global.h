#pragma once

namespace geofetch::downloader {

// curl_global_init exactly once per process, before the first easy handle
void ensureCurlGlobalInit();

} // namespace geofetch::downloader
