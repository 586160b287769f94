#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>

namespace zonekit {

    // Progress and message channel. Reporting an error does not stop a run.
    class Feedback {
      public:
        virtual ~Feedback() = default;

        virtual void setProgress(int percent) = 0;
        virtual void pushInfo(const std::string &message) = 0;
        virtual void reportError(const std::string &message) = 0;
        virtual bool isCanceled() const = 0;
    };

    class StreamFeedback : public Feedback {
      public:
        StreamFeedback();
        StreamFeedback(std::ostream &out, std::ostream &err, bool show_progress = true);

        void setProgress(int percent) override;
        void pushInfo(const std::string &message) override;
        void reportError(const std::string &message) override;
        bool isCanceled() const override { return canceled_; }

        void cancel() { canceled_ = true; }

        int progress() const { return progress_; }
        std::size_t errorCount() const { return errors_; }

      private:
        std::ostream &out_;
        std::ostream &err_;
        bool show_progress_ = true;
        bool canceled_ = false;
        int progress_ = -1;
        std::size_t errors_ = 0;
    };

} // namespace zonekit
