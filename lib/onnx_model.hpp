#pragma once
#include "config.hpp"
#include "model_info.hpp"
#include <onnxruntime_cxx_api.h>
#include <string>

class OnnxModel {
public:
    // throws Ort::Exception on failure
    OnnxModel(Ort::Env&              env,
              const std::string&     model_path,
              const SessionSettings& settings,
              const char*            tag);

    // accessors the engines need
    Ort::Session&            session()       { return session_; }
    const modelutil::ModelIo& io()     const  { return io_;      }

private:
    Ort::SessionOptions              opts_;
    Ort::Session                     session_;
    Ort::AllocatorWithDefaultOptions allocator_;
    modelutil::ModelIo               io_;
};
