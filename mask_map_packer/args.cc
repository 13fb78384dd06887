/*
 * Copyright 2019 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "args.h"  // NOLINT: Silence relative path warning.

#include <stdio.h>
#include <algorithm>
#include <iostream>
#include <limits>
#include <memory>
#include <vector>
#include "common/common_util.h"
#include "tclap/CmdLine.h"

namespace {
// Get offset from the default pack settings. This allows us to reference
// members of the default by name in Bind().
size_t GetDefaultOffset(const void* member) {
  const size_t offset =
      static_cast<const char*>(member) -
      reinterpret_cast<const char*>(&mmp::PackSettings::kDefault);
  MMP_ASSERT_LOGIC(offset <= sizeof(mmp::PackSettings));
  return offset;
}

template <typename T>
std::string ToString(const T& v) {
  return std::to_string(v);
}

std::string ToString(uint8_t v) {
  return std::to_string(static_cast<int>(v));
}

std::string ToString(float v) {
  char text[32];
  snprintf(text, sizeof(text), "%g", v);
  return text;
}

const std::string& ToString(const std::string& v) {
  return v;
}

class ArgParser {
 public:
  ArgParser()
      : nousage_(false),
        output_(this),
        cmd_(""),
        paths_("output",
               "Output mask map (.png). Defaults to the name of the first "
               "source, with its last word replaced by 'Mask'.",
               false, "path"),
        nousage_arg_("", "nousage", "Don't print usage on argument error.") {
    cmd_.setOutput(&output_);
    cmd_.setExceptionHandling(false);

    Bind();

    // For some reason TCLAP lists parameters in reverse, so add them in reverse
    // to correct this.
    cmd_.add(nousage_arg_);
    const size_t binder_count = binders_.size();
    for (size_t i = binder_count; i != 0; ) {
      --i;
      binders_[i]->Add(&cmd_);
    }
    cmd_.add(paths_);
  }

  bool Parse(
      int argc, const char* const* argv, Args* out_args, mmp::Logger* logger) {
    try {
      // Convert args to vector, replacing arg[0] with the short exe name.
      // * We also explicitly check for --nousage because we need this argument
      //   before parse completes.
      nousage_ = false;
      argc = std::max(argc, 1);
      std::vector<std::string> arg_vec(argc);
      arg_vec[0] = "mask_map_packer";
      for (int i = 1; i != argc; ++i) {
        const char* const arg = argv[i];
        if (mmp::StringEqualCI(arg, "--nousage")) {
          nousage_ = true;
        }
        arg_vec[i] = arg;
      }

      // Parse args.
      cmd_.reset();
      cmd_.parse(arg_vec);

      // The unnamed 'output' argument acts as the catch-all, which
      // unfortunately means mistyped flags will also be treated as paths.
      // Explicitly emit errors for these.
      const std::vector<std::string>& paths = paths_.getValue();
      bool have_unknown_flags = false;
      for (const std::string& path : paths) {
        if (path.compare(0, 2, "--") == 0) {
          mmp::Log<mmp::MMP_ERROR_ARGUMENT_UNKNOWN>(logger, "", path.c_str());
          have_unknown_flags = true;
        }
      }
      if (have_unknown_flags) {
        return false;
      }

      if (paths.size() > 1) {
        mmp::Log<mmp::MMP_ERROR_ARGUMENT_PATHS>(logger, "", paths.size());
        return false;
      }
      out_args->dst = paths.empty() ? std::string() : paths[0];

      // Apply arguments to settings.
      bool success = true;
      for (const std::unique_ptr<IBinder>& binder : binders_) {
        if (!binder->Apply(out_args, logger)) {
          success = false;
        }
      }
      return success;
    } catch (const TCLAP::ArgException& e) {
      mmp::Log<mmp::MMP_ERROR_ARGUMENT_EXCEPTION>(
          logger, "", e.argId().c_str(), e.error().c_str());
      return false;
    } catch (const TCLAP::ExitException&) {
      out_args->exit = true;
      return true;
    }
  }

  void PrintShortUsage() {
    output_.PrintShortUsage();
  }

 private:
  class IBinder {
   public:
    virtual ~IBinder() {}
    virtual void Add(TCLAP::CmdLine* cmd) = 0;
    virtual bool Apply(Args* args, mmp::Logger* logger) = 0;
  };

  class Output : public TCLAP::StdOutput {
   public:
    explicit Output(ArgParser* parser) : parser_(parser) {}
    void usage(TCLAP::CmdLineInterface& c) override {
      if (parser_->nousage_) {
        return;
      }
      PrintLongUsage();
    }

    void PrintShortUsage() const {
      if (parser_->nousage_) {
        return;
      }
      printf("Usage: \n");
      _shortUsage(parser_->cmd_, std::cout);
    }

    void PrintLongUsage() const {
      if (parser_->nousage_) {
        return;
      }
      printf("mask_map_packer - Pack grayscale textures into an RGBA mask "
             "map.\n");
      PrintShortUsage();
      printf("Where: \n");
      _longUsage(parser_->cmd_, std::cout);
    }

   private:
    ArgParser* parser_;
  };

  bool nousage_;
  Output output_;
  TCLAP::CmdLine cmd_;
  std::vector<std::unique_ptr<IBinder>> binders_;
  TCLAP::UnlabeledMultiArg<std::string> paths_;
  TCLAP::SwitchArg nousage_arg_;

  // For switches, this adds an inverse 'no' flag (e.g. --invert_smoothness and
  // --noinvert_smoothness).
  class SwitchBinder : public IBinder {
   public:
    SwitchBinder(const char* name, const char* desc, const bool* def)
        : name_(name),
          desc_(desc),
          offset_(GetDefaultOffset(def)),
          def_(*def) {}
    void Add(TCLAP::CmdLine* cmd) override {
      const std::string on_name = name_;
      const std::string off_name = "no" + on_name;
      const std::string on_desc =
          std::string(desc_) + (def_ ? " [Default]" : "");
      const std::string off_desc =
          "Disable --" + on_name + (!def_ ? ". [Default]" : ".");
      on_ = std::unique_ptr<TCLAP::SwitchArg>(
          new TCLAP::SwitchArg("", on_name, on_desc, def_));
      off_ = std::unique_ptr<TCLAP::SwitchArg>(
          new TCLAP::SwitchArg("", off_name, off_desc, !def_));
      cmd->add(*off_);
      cmd->add(*on_);
    }
    bool Apply(Args* args, mmp::Logger* logger) override {
      bool* const out_value = reinterpret_cast<bool*>(
          reinterpret_cast<char*>(&args->settings) + offset_);
      *out_value = def_ ? !off_->getValue() : on_->getValue();
      return true;
    }

   private:
    const char* name_;
    const char* desc_;
    size_t offset_;
    bool def_;
    std::unique_ptr<TCLAP::SwitchArg> on_;
    std::unique_ptr<TCLAP::SwitchArg> off_;
  };

  static const char* GetValueTypeName(int) { return "int"; }
  static const char* GetValueTypeName(uint32_t) { return "uint"; }
  static const char* GetValueTypeName(uint8_t) { return "uint"; }
  static const char* GetValueTypeName(float) { return "float"; }
  static const char* GetValueTypeName(const std::string&) { return "string"; }

  template <typename T>
  static bool ValueExists(T) { return true; }
  static bool ValueExists(const std::string& v) { return !v.empty(); }

  template <typename T>
  static bool ValueInRange(T v, double min, double max) {
    return v >= min && v <= max;
  }
  static bool ValueInRange(const std::string&, double, double) { return true; }
  template <typename T>
  static double ValueToDouble(T v) { return static_cast<double>(v); }
  static double ValueToDouble(const std::string&) { return 0.0; }

  // Numeric values outside [min, max] are rejected with an error.
  template <typename DstType, typename ArgType>
  class ValueBinder : public IBinder {
    using Arg = TCLAP::ValueArg<ArgType>;

   public:
    ValueBinder(const char* name, const char* desc, const DstType* def,
                double min = -std::numeric_limits<double>::max(),
                double max = std::numeric_limits<double>::max())
        : name_(name),
          desc_(desc),
          offset_(GetDefaultOffset(def)),
          def_(*def),
          min_(min),
          max_(max) {}
    void Add(TCLAP::CmdLine* cmd) override {
      const std::string desc =
          std::string(desc_) + " [default=" + ToString(def_) + "]";
      arg_ = std::unique_ptr<Arg>(new Arg(
          "", name_, desc, false, static_cast<ArgType>(def_),
          GetValueTypeName(def_)));
      cmd->add(*arg_);
    }
    bool Apply(Args* args, mmp::Logger* logger) override {
      const ArgType arg_value = arg_->getValue();
      if (!ValueInRange(arg_value, min_, max_)) {
        mmp::Log<mmp::MMP_ERROR_ARGUMENT_RANGE>(
            logger, "", name_, min_, max_, ValueToDouble(arg_value));
        return false;
      }
      DstType* const out_value = reinterpret_cast<DstType*>(
          reinterpret_cast<char*>(&args->settings) + offset_);
      const DstType value = static_cast<DstType>(arg_value);
      if (ValueExists(value)) {
        *out_value = value;
      }
      return true;
    }

   private:
    const char* name_;
    const char* desc_;
    size_t offset_;
    DstType def_;
    double min_;
    double max_;
    std::unique_ptr<Arg> arg_;
  };
  using UintBinder = ValueBinder<uint32_t, int>;
  using Uint8Binder = ValueBinder<uint8_t, int>;
  using FloatBinder = ValueBinder<float, float>;
  using StringBinder = ValueBinder<std::string, std::string>;

  void Bind() {
    const mmp::PackSettings& def = mmp::PackSettings::kDefault;
    binders_.emplace_back(new StringBinder("metallic",
        "Metallic source texture, packed into R.",
        &def.metallic_path));
    binders_.emplace_back(new StringBinder("occlusion",
        "Ambient occlusion source texture, packed into G.",
        &def.occlusion_path));
    binders_.emplace_back(new StringBinder("detail",
        "Detail mask source texture, packed into B.",
        &def.detail_path));
    binders_.emplace_back(new StringBinder("smoothness",
        "Smoothness (or roughness) source texture, packed into A.",
        &def.smoothness_path));
    binders_.emplace_back(new FloatBinder ("default_metallic",
        "Metallic value used when there is no metallic texture.",
        &def.default_metallic, 0.0, 1.0));
    binders_.emplace_back(new FloatBinder ("default_occlusion",
        "Occlusion value used when there is no occlusion texture.",
        &def.default_occlusion, 0.0, 1.0));
    binders_.emplace_back(new FloatBinder ("default_detail",
        "Detail mask value used when there is no detail mask texture.",
        &def.default_detail, 0.0, 1.0));
    binders_.emplace_back(new FloatBinder ("default_smoothness",
        "Smoothness value used when there is no smoothness texture.",
        &def.default_smoothness, 0.0, 1.0));
    binders_.emplace_back(new SwitchBinder("invert_smoothness",
        "Invert the smoothness channel, for roughness sources.",
        &def.invert_smoothness));
    binders_.emplace_back(new Uint8Binder ("png_level",
        "PNG compression level [0=fastest, 9=smallest].",
        &def.png_level, 0.0, 9.0));
    binders_.emplace_back(new UintBinder  ("workers",
        "Worker threads used for packing [0=packs on the main thread].",
        &def.worker_count, 0.0, 64.0));
    binders_.emplace_back(new SwitchBinder("print_timing",
        "Print packing time stats.",
        &def.print_timing));
  }
};
}  // namespace

bool ParseArgs(
    int argc, const char* const* argv, Args* out_args, mmp::Logger* logger) {
  ArgParser parser;
  const bool success = parser.Parse(argc, argv, out_args, logger);
  if (!success) {
    parser.PrintShortUsage();
  }
  return success;
}
