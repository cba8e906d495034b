#include "Models.hpp"
#include <regex>

void Model::saveStateDict(const std::string &file_name) {
  torch::serialize::OutputArchive archive;
  auto params = this->named_parameters(true /*recurse*/);
  auto buffers = this->named_buffers(true /*recurse*/);
  for (const auto &val : params) {
    if (val.value().numel()) {
      archive.write(val.key(), val.value());
    }
  }
  for (const auto &val : buffers) {
    if (val.value().numel()) {
      archive.write(val.key(), val.value(), /*is_buffer*/ true);
    }
  }
  archive.save_to(file_name);
}

void Model::loadStateDict(const std::string &file_name,
                          const std::string &ignore_name_regex) {
  torch::serialize::InputArchive archive;
  archive.load_from(file_name);
  torch::NoGradGuard no_grad;
  std::regex re(ignore_name_regex);
  std::smatch m;
  auto params = this->named_parameters(true /*recurse*/);
  auto buffers = this->named_buffers(true /*recurse*/);
  for (auto &val : params) {
    if (ignore_name_regex.empty() || !std::regex_match(val.key(), m, re)) {
      archive.read(val.key(), val.value());
    }
  }
  for (auto &val : buffers) {
    if (ignore_name_regex.empty() || !std::regex_match(val.key(), m, re)) {
      archive.read(val.key(), val.value(), /*is_buffer*/ true);
    }
  }
}

void Model::copyParams(const NamedParameters &newParams,
                       const NamedParameters &newBuffers) {
  torch::NoGradGuard no_grad;

  auto params = this->named_parameters(true /*recurse*/);
  for (const auto &val : newParams) {
    auto *t = params.find(val.key());
    if (t != nullptr) {
      t->copy_(val.value());
    }
  }

  auto buffers = this->named_buffers(true /*recurse*/);
  for (const auto &val : newBuffers) {
    auto *t = buffers.find(val.key());
    if (t != nullptr) {
      t->copy_(val.value());
    }
  }
}

void Model::copyFrom(Model &fromModel) {
  auto newParams = fromModel.named_parameters(true /*recurse*/);
  auto newBuffers = fromModel.named_buffers(true /*recurse*/);
  copyParams(newParams, newBuffers);
}

void Model::softUpdateFrom(Model &fromModel, double tau) {
  torch::NoGradGuard no_grad;

  auto params = this->named_parameters(true /*recurse*/);
  for (const auto &val : fromModel.named_parameters(true /*recurse*/)) {
    auto *t = params.find(val.key());
    if (t != nullptr) {
      t->mul_(1.0 - tau).add_(val.value(), tau);
    }
  }

  // running statistics are copied, not blended
  auto buffers = this->named_buffers(true /*recurse*/);
  for (const auto &val : fromModel.named_buffers(true /*recurse*/)) {
    auto *t = buffers.find(val.key());
    if (t != nullptr) {
      t->copy_(val.value());
    }
  }
}

FCQFunction::FCQFunction(int64_t nInput, int64_t n_actions,
                         std::vector<int64_t> hiddenSizes)
    : QFunction(n_actions) {
  auto inSize = nInput;
  for (size_t i = 0; i < hiddenSizes.size(); i++) {
    head.push_back(register_module("head" + std::to_string(i),
                                   torch::nn::Linear(inSize, hiddenSizes[i])));
    inSize = hiddenSizes[i];
  }
  tail = register_module("tail", torch::nn::Linear(inSize, n_actions));
}

ActionValue FCQFunction::forward(const torch::Tensor &x) {
  auto feature = x.to(torch::kFloat32).contiguous().view({x.size(0), -1});
  for (auto &layer : head) {
    feature = torch::relu(layer->forward(feature));
  }
  return ActionValue(tail->forward(feature));
}
