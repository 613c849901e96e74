#pragma once

#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

#include "workQueue.hpp"

// the url list could not be read, fatal for the run
class UrlSourceError : public std::runtime_error {
   public:
    explicit UrlSourceError(const std::string& filename);
    const std::string& filename() const { return m_filename; }

   private:
    std::string m_filename;
};

// strips surrounding whitespace, inner whitespace is kept
std::string trim(const std::string& str);

// one item per line, trimmed; blank lines become empty urls
std::vector<std::string> load_urls(std::istream& in);
std::vector<std::string> load_urls(const std::string& filename);

void fill_queue(WorkQueue& queue, const std::vector<std::string>& urls);
