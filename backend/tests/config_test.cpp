#include <cassert>
#include <cstdlib>
#include <string>

#include "config/EngineConfig.hpp"
#include "TestSupport.hpp"

int main() {
    unsetenv("FLAG_SECRET_KEY");
    unsetenv("FLAG_EXPIRY_MINUTES");
    unsetenv("FLAG_SALT_ROTATION_HOURS");

    {
        const std::string path = "tmp_flagforge_full.ini";
        writeFile(path,
                  "# flag engine\n"
                  "[flags]\n"
                  "secret_key = 0123456789abcdef0123  # hmac key\n"
                  "window_minutes = 30\n"
                  "salt_rotation_hours = 12\n"
                  "prefix = CTF{\n"
                  "suffix = }\n"
                  "max_rotation_retries = 7\n"
                  "[storage]\ndata_dir = /var/lib/flagforge\n"
                  "[log]\nfile = ff.log\nlevel = debug\n");
        EngineConfig cfg;
        std::string err;
        bool ok = loadConfig(path, cfg, err);
        assert(ok);
        assert(cfg.secret_key == "0123456789abcdef0123");
        assert(cfg.window_seconds == 30 * 60);
        assert(cfg.windowMinutes() == 30);
        assert(cfg.salt_rotation_seconds == 12 * 3600);
        assert(cfg.flag_prefix == "CTF{");
        assert(cfg.flag_suffix == "}");
        assert(cfg.max_rotation_retries == 7);
        assert(cfg.data_dir == "/var/lib/flagforge");
        assert(cfg.log_file == "ff.log");
        assert(cfg.log_level == "debug");
    }

    {
        const std::string path = "tmp_flagforge_defaults.ini";
        writeFile(path, "[flags]\nsecret_key=0123456789abcdef\n");
        EngineConfig cfg;
        std::string err;
        bool ok = loadConfig(path, cfg, err);
        assert(ok);
        assert(cfg.window_seconds == 3600);
        assert(cfg.salt_rotation_seconds == 86400);
        assert(cfg.flag_prefix == "FORENSIC{");
        assert(cfg.flag_suffix == "}");
    }

    {
        const std::string path = "tmp_flagforge_short_secret.ini";
        writeFile(path, "[flags]\nsecret_key=short\n");
        EngineConfig cfg;
        std::string err;
        assert(!loadConfig(path, cfg, err));
        assert(!err.empty());
    }

    {
        const std::string path = "tmp_flagforge_zero_window.ini";
        writeFile(path, "[flags]\nsecret_key=0123456789abcdef\nwindow_minutes=0\n");
        EngineConfig cfg;
        std::string err;
        assert(!loadConfig(path, cfg, err));
    }

    {
        const std::string path = "tmp_flagforge_bad_number.ini";
        writeFile(path, "[flags]\nsecret_key=0123456789abcdef\nwindow_minutes=-5\n");
        EngineConfig cfg;
        std::string err;
        assert(!loadConfig(path, cfg, err));
        assert(err == "invalid value for 'window_minutes' on line 3");
    }

    {
        const std::string path = "tmp_flagforge_bad_line.ini";
        writeFile(path, "[flags]\nsecret_key\n");
        EngineConfig cfg;
        std::string err;
        assert(!loadConfig(path, cfg, err));
        assert(err == "invalid line 2");
    }

    {
        EngineConfig cfg;
        std::string err;
        assert(!loadConfig("tmp_flagforge_does_not_exist.ini", cfg, err));
        assert(err == "config file not found: tmp_flagforge_does_not_exist.ini");
    }

    {
        const std::string path = "tmp_flagforge_env.ini";
        writeFile(path, "[flags]\nsecret_key=file-secret-is-long-enough\nwindow_minutes=30\n");
        setenv("FLAG_SECRET_KEY", "env-secret-is-also-long-enough", 1);
        setenv("FLAG_EXPIRY_MINUTES", "5", 1);
        setenv("FLAG_SALT_ROTATION_HOURS", "2", 1);
        EngineConfig cfg;
        std::string err;
        bool ok = loadConfig(path, cfg, err);
        assert(ok);
        assert(cfg.secret_key == "env-secret-is-also-long-enough");
        assert(cfg.window_seconds == 300);
        assert(cfg.salt_rotation_seconds == 7200);

        setenv("FLAG_EXPIRY_MINUTES", "soon", 1);
        assert(!loadConfig(path, cfg, err));
        assert(err == "invalid FLAG_EXPIRY_MINUTES");
        unsetenv("FLAG_EXPIRY_MINUTES");
        unsetenv("FLAG_SALT_ROTATION_HOURS");
    }

    {
        // no file: defaults plus environment
        EngineConfig cfg;
        std::string err;
        assert(finalizeConfig(cfg, err));
        assert(cfg.secret_key == "env-secret-is-also-long-enough");
        unsetenv("FLAG_SECRET_KEY");

        EngineConfig bare;
        assert(!finalizeConfig(bare, err));
    }

    {
        // configs built in code get the same checks as loaded ones
        std::string err;
        assert(validateConfig(testConfig(), err));

        EngineConfig no_secret;
        assert(!validateConfig(no_secret, err));
        assert(err == "flag secret_key missing or shorter than 16 bytes");

        EngineConfig zero_window = testConfig();
        zero_window.window_seconds = 0;
        assert(!validateConfig(zero_window, err));

        EngineConfig no_prefix = testConfig();
        no_prefix.flag_prefix.clear();
        assert(!validateConfig(no_prefix, err));
    }

    return 0;
}
