#include "bench_common.hpp"

#include "paramvault/crypto/random.hpp"
#include "paramvault/params/record_codec.hpp"

void run_codec_benchmark() {
  const auto name_key = paramvault::crypto::generate_key();
  const auto value_key = paramvault::crypto::generate_key();
  if (!name_key.ok() || !value_key.ok()) {
    std::cerr << "codec bench skipped: key generation failed\n";
    return;
  }
  const std::string value(256, 'v');
  const auto digest = paramvault::params::digest(name_key.value(), "bench-name").value();
  const auto blob =
      paramvault::params::encode(value_key.value(), digest, "bench-name", value).value();

  paramvault::bench::run_bench("codec_digest", 10000, [&] {
    (void)paramvault::params::digest(name_key.value(), "bench-name");
  });
  paramvault::bench::run_bench("codec_encode", 10000, [&] {
    (void)paramvault::params::encode(value_key.value(), digest, "bench-name", value);
  });
  paramvault::bench::run_bench("codec_decode", 10000, [&] {
    (void)paramvault::params::decode(value_key.value(), digest, blob);
  });
}
