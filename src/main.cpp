#include "analysis.hpp"
#include "analysis_config.hpp"
#include "box_count.hpp"
#include "cli_benchmark.hpp"
#include "field_builder.hpp"
#include "heatmap_palette.hpp"
#include "image_io.hpp"
#include "report.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <memory>
#include <string>

static void print_usage(const char* argv0)
{
    fprintf(stderr,
        "usage: %s <input.png> [options]\n"
        "       %s --benchmark\n"
        "\n"
        "  -o <path>              heatmap output (default heatmap_<timestamp>.png)\n"
        "  --size S               standardized square size (1024)\n"
        "  --neighborhood N       neighborhood side length (32)\n"
        "  --min-box B            minimum box size (2)\n"
        "  --scale k              box size scaling factor (2)\n"
        "  --binarize MODE        none | fixed | otsu (fixed)\n"
        "  --threshold T          fixed threshold, 0-255 (113)\n"
        "  --encoding E           foreground value: 01 | 0255 (01)\n"
        "  --occupancy MODE       any | all (any)\n"
        "  --palette NAME         buckets | gradient | fire | ice | grayscale (buckets)\n"
        "  --range LO HI          fixed palette domain (default: 0 to the estimator's maximum)\n"
        "  --threads n            worker threads, 0 = all cores (0)\n"
        "  --matrix <path>        write the field as a text matrix\n"
        "  --json <path>          write the response payload ('-' for stdout)\n"
        "  --payload field|grid   matrix carried by the payload (field)\n"
        "  --global               also print the whole-grid dimension\n"
        "  --jxl                  encode the heatmap as JPEG XL\n"
        "  --quiet                no summary on stdout\n",
        argv0, argv0);
}

static bool parse_int(const char* s, int& out)
{
    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(s, &end, 10);
    if (errno != 0 || end == s || *end != '\0' || v < -1000000000L || v > 1000000000L)
        return false;
    out = static_cast<int>(v);
    return true;
}

static bool parse_double(const char* s, double& out)
{
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(s, &end);
    if (errno != 0 || end == s || *end != '\0') return false;
    out = v;
    return true;
}

// heatmap_<YYYYmmdd_HHMMSS>.<ext>
static std::string default_output_name(const char* ext)
{
    std::time_t t = std::time(nullptr);
    std::tm* tm = std::localtime(&t);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y%m%d_%H%M%S", tm);
    return std::string("heatmap_") + ts + "." + ext;
}

static int fail(const Status& st)
{
    fprintf(stderr, "error [%s]: %s\n", error_code_name(st.code), st.message.c_str());
    return 1;
}

int main(int argc, char* argv[])
{
    if (argc < 2) {
        print_usage(argv[0]);
        return 2;
    }
    if (std::strcmp(argv[1], "--benchmark") == 0)
        return run_cli_benchmark();

    AnalysisConfig  cfg;
    ResponseOptions resp;
    const char*     input       = nullptr;
    std::string     output;
    const char*     matrix_path = nullptr;
    const char*     json_path   = nullptr;
    bool            global      = false;
    bool            use_jxl     = false;
    bool            quiet       = false;

    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        const bool has_val = i + 1 < argc;
        bool ok = true;

        if (std::strcmp(a, "-o") == 0 && has_val) {
            output = argv[++i];
        } else if (std::strcmp(a, "--size") == 0 && has_val) {
            ok = parse_int(argv[++i], cfg.square_size);
        } else if (std::strcmp(a, "--neighborhood") == 0 && has_val) {
            ok = parse_int(argv[++i], cfg.neighborhood_size);
        } else if (std::strcmp(a, "--min-box") == 0 && has_val) {
            ok = parse_int(argv[++i], cfg.min_box_size);
        } else if (std::strcmp(a, "--scale") == 0 && has_val) {
            ok = parse_int(argv[++i], cfg.scaling_factor);
        } else if (std::strcmp(a, "--binarize") == 0 && has_val) {
            ok = parse_binarize_mode(argv[++i], cfg.binarize_mode);
        } else if (std::strcmp(a, "--threshold") == 0 && has_val) {
            ok = parse_int(argv[++i], cfg.threshold);
        } else if (std::strcmp(a, "--encoding") == 0 && has_val) {
            ok = parse_binary_encoding(argv[++i], cfg.binary_encoding);
        } else if (std::strcmp(a, "--occupancy") == 0 && has_val) {
            ok = parse_occupancy_mode(argv[++i], cfg.occupancy);
        } else if (std::strcmp(a, "--palette") == 0 && has_val) {
            ok = parse_palette_kind(argv[++i], cfg.palette.kind);
        } else if (std::strcmp(a, "--range") == 0 && i + 2 < argc) {
            ok = parse_double(argv[i + 1], cfg.palette.lo) &&
                 parse_double(argv[i + 2], cfg.palette.hi);
            cfg.palette.fit_estimator = false;
            i += 2;
        } else if (std::strcmp(a, "--threads") == 0 && has_val) {
            ok = parse_int(argv[++i], cfg.thread_count);
        } else if (std::strcmp(a, "--matrix") == 0 && has_val) {
            matrix_path = argv[++i];
        } else if (std::strcmp(a, "--json") == 0 && has_val) {
            json_path = argv[++i];
        } else if (std::strcmp(a, "--payload") == 0 && has_val) {
            const char* p = argv[++i];
            if (std::strcmp(p, "field") == 0) {
                resp.payload    = PayloadKind::Field;
                resp.matrix_key = "fractalDimensionMatrix";
            } else if (std::strcmp(p, "grid") == 0) {
                resp.payload    = PayloadKind::BinaryGrid;
                resp.matrix_key = "grayscaleData";
            } else {
                ok = false;
            }
        } else if (std::strcmp(a, "--global") == 0) {
            global = true;
        } else if (std::strcmp(a, "--jxl") == 0) {
            use_jxl = true;
        } else if (std::strcmp(a, "--quiet") == 0) {
            quiet = true;
        } else if (a[0] != '-' && !input) {
            input = a;
        } else {
            ok = false;
        }

        if (!ok) {
            fprintf(stderr, "bad argument near '%s'\n", a);
            print_usage(argv[0]);
            return 2;
        }
    }

    if (!input) {
        print_usage(argv[0]);
        return 2;
    }
    if (use_jxl && !jxl_available()) {
        fprintf(stderr, "built without JPEG XL support\n");
        return 2;
    }
    if (output.empty())
        output = default_output_name(use_jxl ? "jxl" : "png");
    resp.heatmap_path = output;

    Status st = validate_config(cfg);
    if (!st.ok()) return fail(st);

    GrayImage img;
    st = load_grayscale_png(input, img);
    if (!st.ok()) return fail(st);

    FieldBuilder builder(cfg.thread_count);
    AnalysisResult result;
    st = analyze_grayscale(img.pixels.data(), img.pixels.size(), img.width,
                           cfg, builder, result);
    if (!st.ok()) return fail(st);

#ifdef HAVE_JXL
    st = use_jxl ? export_jxl(output.c_str(), result.heatmap)
                 : export_png(output.c_str(), result.heatmap);
#else
    st = export_png(output.c_str(), result.heatmap);
#endif
    if (!st.ok()) return fail(st);

    if (matrix_path) {
        st = write_matrix_text(matrix_path, result.field);
        if (!st.ok()) return fail(st);
    }

    if (json_path) {
        if (std::strcmp(json_path, "-") == 0) {
            st = write_response_json(stdout, resp, result);
        } else {
            std::unique_ptr<FILE, int (*)(FILE*)> fp(std::fopen(json_path, "w"), &std::fclose);
            st = fp ? write_response_json(fp.get(), resp, result)
                    : Status(ErrorCode::CodecFailure,
                             std::string("Cannot open file for writing: ") + json_path);
        }
        if (!st.ok()) return fail(st);
    }

    double global_dim = 0.0;
    if (global) {
        st = global_dimension(result.binary, cfg, 64, global_dim);
        if (!st.ok()) return fail(st);
    }

    if (!quiet) {
        const FieldSummary s = field_summary(result.field);
        printf("input       %s (%dx%d)\n", input, img.width, img.height);
        printf("canvas      %dx%d, N=%d, B_min=%d, k=%d, occupancy=%s\n",
               cfg.square_size, cfg.square_size, cfg.neighborhood_size,
               cfg.min_box_size, cfg.scaling_factor, occupancy_mode_name(cfg.occupancy));
        if (result.threshold_used >= 0)
            printf("binarize    %s, threshold %d\n",
                   binarize_mode_name(cfg.binarize_mode), result.threshold_used);
        else
            printf("binarize    none\n");
        printf("field       min %.4f  max %.4f  mean %.4f\n", s.min, s.max, s.mean);
        if (global)
            printf("global      %.4f\n", global_dim);
        printf("build       %.1f ms on %d threads\n",
               builder.last_build_ms, builder.thread_count);
        printf("heatmap     %s\n", output.c_str());
    }
    return 0;
}
